// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "trie_updates.hpp"

#include <utility>

namespace spindle::trie {

template <class Nodes, class Removed>
static void merge_nodes(Nodes& nodes, Removed& removed, Nodes other_nodes, Removed other_removed) {
    for (const auto& path : other_removed) {
        nodes.erase(path);
        removed.insert(path);
    }
    for (auto& [path, node] : other_nodes) {
        removed.erase(path);
        nodes.insert_or_assign(path, std::move(node));
    }
}

void StorageTrieUpdates::extend(StorageTrieUpdates other) {
    if (other.is_deleted) {
        storage_nodes.clear();
        removed_nodes.clear();
        is_deleted = true;
    }
    merge_nodes(storage_nodes, removed_nodes, std::move(other.storage_nodes), std::move(other.removed_nodes));
}

void TrieUpdates::extend(TrieUpdates other) {
    merge_nodes(account_nodes, removed_nodes, std::move(other.account_nodes), std::move(other.removed_nodes));
    for (auto& [hashed_address, storage_updates] : other.storage_tries) {
        storage_tries[hashed_address].extend(std::move(storage_updates));
    }
}

}  // namespace spindle::trie
