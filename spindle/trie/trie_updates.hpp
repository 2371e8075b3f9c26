// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>
#include <evmc/evmc.hpp>

#include <spindle/core/common/bytes.hpp>

namespace spindle::trie {

//! Nibble path of a trie node
using NodePath = Bytes;

//! Encoded trie node
using NodeData = Bytes;

struct StorageTrieUpdates {
    bool is_deleted{false};
    absl::btree_map<NodePath, NodeData> storage_nodes;
    absl::btree_set<NodePath> removed_nodes;

    void extend(StorageTrieUpdates other);
    bool empty() const { return !is_deleted && storage_nodes.empty() && removed_nodes.empty(); }

    friend bool operator==(const StorageTrieUpdates&, const StorageTrieUpdates&) = default;
};

//! Trie nodes changed by a state root computation
struct TrieUpdates {
    absl::btree_map<NodePath, NodeData> account_nodes;
    absl::btree_set<NodePath> removed_nodes;
    absl::btree_map<evmc::bytes32, StorageTrieUpdates> storage_tries;  // keyed by hashed address

    //! \brief Applies later updates on top of these ones
    void extend(TrieUpdates other);
    bool empty() const { return account_nodes.empty() && removed_nodes.empty() && storage_tries.empty(); }

    friend bool operator==(const TrieUpdates&, const TrieUpdates&) = default;
};

}  // namespace spindle::trie
