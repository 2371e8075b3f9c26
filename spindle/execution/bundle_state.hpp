// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <vector>

#include <absl/container/btree_map.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/common/bytes.hpp>
#include <spindle/core/types/account.hpp>

namespace spindle::execution {

struct StorageSlot {
    intx::uint256 original_value;
    intx::uint256 present_value;

    bool is_changed() const { return original_value != present_value; }

    friend bool operator==(const StorageSlot&, const StorageSlot&) = default;
};

using StorageChanges = absl::btree_map<intx::uint256, StorageSlot>;

//! Net change of one account across all blocks of a bundle
struct BundleAccount {
    std::optional<Account> original_info;  // nullopt means the account did not exist before the bundle
    std::optional<Account> info;           // nullopt means the account does not exist after the bundle
    StorageChanges storage;

    bool was_destroyed() const { return original_info && !info; }

    friend bool operator==(const BundleAccount&, const BundleAccount&) = default;
};

//! Values an account had before a single block touched it
struct AccountRevert {
    std::optional<Account> previous_info;
    absl::btree_map<intx::uint256, intx::uint256> previous_storage;

    friend bool operator==(const AccountRevert&, const AccountRevert&) = default;
};

using BlockReverts = absl::btree_map<evmc::address, AccountRevert>;

//! Change of one account within a single block, as reported by an executor
struct AccountTransition {
    evmc::address address;
    std::optional<Account> previous_info;
    std::optional<Account> info;
    StorageChanges storage;  // slot -> {value before the block, value after the block}
};

//! Accumulated state diff of a sequence of executed blocks, with one revert set per block
class BundleState {
  public:
    //! \brief Records the account transitions of the next block and appends its reverts
    void apply_transitions(std::span<const AccountTransition> transitions);

    void add_contract(const evmc::bytes32& code_hash, Bytes code);

    //! \brief Appends a bundle built on top of this one
    //! \details Originals of this bundle are kept, present values are taken from other, reverts are concatenated
    void extend(BundleState other);

    //! \brief Estimated number of entries held, i.e. accounts, storage slots, contracts and reverts
    size_t size_hint() const;

    const BundleAccount* account(const evmc::address& address) const;

    //! \brief Present info of the account, nullopt if untouched or non-existent
    std::optional<Account> account_info(const evmc::address& address) const;

    std::optional<intx::uint256> storage(const evmc::address& address, const intx::uint256& slot) const;

    const absl::btree_map<evmc::address, BundleAccount>& state() const { return state_; }
    const absl::btree_map<evmc::bytes32, Bytes>& contracts() const { return contracts_; }
    const std::vector<BlockReverts>& reverts() const { return reverts_; }

    bool empty() const { return state_.empty() && contracts_.empty() && reverts_.empty(); }

    friend bool operator==(const BundleState&, const BundleState&) = default;

  private:
    absl::btree_map<evmc::address, BundleAccount> state_;
    absl::btree_map<evmc::bytes32, Bytes> contracts_;
    std::vector<BlockReverts> reverts_;
};

}  // namespace spindle::execution
