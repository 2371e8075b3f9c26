// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "bundle_state.hpp"

#include <iterator>
#include <utility>

namespace spindle::execution {

void BundleState::apply_transitions(std::span<const AccountTransition> transitions) {
    BlockReverts block_reverts;
    for (const AccountTransition& transition : transitions) {
        auto [it, inserted] = state_.try_emplace(transition.address);
        BundleAccount& account{it->second};
        if (inserted) {
            account.original_info = transition.previous_info;
        }
        account.info = transition.info;

        auto [revert_it, first_in_block] = block_reverts.try_emplace(transition.address);
        AccountRevert& revert{revert_it->second};
        if (first_in_block) {
            revert.previous_info = transition.previous_info;
        }
        for (const auto& [slot, change] : transition.storage) {
            auto [slot_it, slot_inserted] = account.storage.try_emplace(slot, change);
            if (!slot_inserted) {
                slot_it->second.present_value = change.present_value;
            }
            revert.previous_storage.try_emplace(slot, change.original_value);
        }
    }
    reverts_.push_back(std::move(block_reverts));
}

void BundleState::add_contract(const evmc::bytes32& code_hash, Bytes code) {
    contracts_.insert_or_assign(code_hash, std::move(code));
}

void BundleState::extend(BundleState other) {
    for (auto& [address, other_account] : other.state_) {
        auto it{state_.find(address)};
        if (it == state_.end()) {
            state_.emplace(address, std::move(other_account));
            continue;
        }
        BundleAccount& account{it->second};
        account.info = other_account.info;
        for (auto& [slot, other_slot] : other_account.storage) {
            auto [slot_it, inserted] = account.storage.try_emplace(slot, other_slot);
            if (!inserted) {
                slot_it->second.present_value = other_slot.present_value;
            }
        }
    }
    for (auto& [code_hash, code] : other.contracts_) {
        contracts_.insert_or_assign(code_hash, std::move(code));
    }
    reverts_.insert(reverts_.end(), std::make_move_iterator(other.reverts_.begin()),
                    std::make_move_iterator(other.reverts_.end()));
}

size_t BundleState::size_hint() const {
    size_t size{state_.size() + contracts_.size()};
    for (const auto& [_, account] : state_) {
        size += account.storage.size();
    }
    for (const BlockReverts& block_reverts : reverts_) {
        size += block_reverts.size();
        for (const auto& [_, revert] : block_reverts) {
            size += revert.previous_storage.size();
        }
    }
    return size;
}

const BundleAccount* BundleState::account(const evmc::address& address) const {
    const auto it{state_.find(address)};
    return it != state_.end() ? &it->second : nullptr;
}

std::optional<Account> BundleState::account_info(const evmc::address& address) const {
    const BundleAccount* account{this->account(address)};
    return account ? account->info : std::nullopt;
}

std::optional<intx::uint256> BundleState::storage(const evmc::address& address, const intx::uint256& slot) const {
    const BundleAccount* account{this->account(address)};
    if (!account) return std::nullopt;
    const auto it{account->storage.find(slot)};
    if (it == account->storage.end()) return std::nullopt;
    return it->second.present_value;
}

}  // namespace spindle::execution
