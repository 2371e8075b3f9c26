// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <absl/container/btree_map.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/types/account.hpp>
#include <spindle/execution/bundle_state.hpp>

namespace spindle::trie {

//! Storage of one account keyed by hashed slot
struct HashedStorage {
    bool wiped{false};  // all previous storage of the account is gone
    absl::btree_map<evmc::bytes32, intx::uint256> storage;

    friend bool operator==(const HashedStorage&, const HashedStorage&) = default;
};

//! Post-execution state keyed by hashed addresses and slots, as consumed by trie root computation
struct HashedPostState {
    absl::btree_map<evmc::bytes32, std::optional<Account>> accounts;  // nullopt for destroyed accounts
    absl::btree_map<evmc::bytes32, HashedStorage> storages;

    static HashedPostState from_bundle_state(const execution::BundleState& bundle);

    //! \brief Overlays a later post state on top of this one
    void extend(HashedPostState other);

    bool empty() const { return accounts.empty() && storages.empty(); }

    friend bool operator==(const HashedPostState&, const HashedPostState&) = default;
};

}  // namespace spindle::trie
