// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "hashed_post_state.hpp"

#include <utility>

#include <spindle/core/common/util.hpp>

namespace spindle::trie {

static evmc::bytes32 hash_slot(const intx::uint256& slot) {
    uint8_t buffer[32];
    intx::be::unsafe::store(buffer, slot);
    return keccak256_hash(ByteView{buffer, sizeof(buffer)});
}

HashedPostState HashedPostState::from_bundle_state(const execution::BundleState& bundle) {
    HashedPostState post_state;
    for (const auto& [address, account] : bundle.state()) {
        const evmc::bytes32 hashed_address{keccak256_hash(ByteView{address.bytes, kAddressLength})};
        post_state.accounts.insert_or_assign(hashed_address, account.info);

        HashedStorage hashed_storage;
        hashed_storage.wiped = account.was_destroyed();
        for (const auto& [slot, value] : account.storage) {
            hashed_storage.storage.insert_or_assign(hash_slot(slot), value.present_value);
        }
        if (hashed_storage.wiped || !hashed_storage.storage.empty()) {
            post_state.storages.insert_or_assign(hashed_address, std::move(hashed_storage));
        }
    }
    return post_state;
}

void HashedPostState::extend(HashedPostState other) {
    for (auto& [hashed_address, account] : other.accounts) {
        accounts.insert_or_assign(hashed_address, std::move(account));
    }
    for (auto& [hashed_address, other_storage] : other.storages) {
        HashedStorage& storage{storages[hashed_address]};
        if (other_storage.wiped) {
            storage.wiped = true;
            storage.storage.clear();
        }
        for (auto& [hashed_slot, value] : other_storage.storage) {
            storage.storage.insert_or_assign(hashed_slot, value);
        }
    }
}

}  // namespace spindle::trie
