// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transfer_executor.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <spindle/core/common/base.hpp>
#include <spindle/execution/execution_error.hpp>

namespace spindle::test_util {

using execution::BlockExecutionError;
using execution::ExecutionErrorCode;

static uint64_t intrinsic_gas(const Transaction& txn) {
    uint64_t gas{kMinTransactionGas};
    for (const uint8_t byte : txn.data) {
        gas += byte == 0 ? 4 : 16;
    }
    return gas;
}

std::optional<Account> TransferExecutor::read_account(const evmc::address& address) const {
    const auto it{accounts_.find(address)};
    if (it != accounts_.end()) {
        return it->second;
    }
    return state_->read_account(address);
}

execution::BlockExecutionResult TransferExecutor::execute_one(const RecoveredBlock& block) {
    const BlockNum block_num{block.number()};
    if (fail_at_ && *fail_at_ == block_num) {
        throw std::runtime_error{"injected execution failure"};
    }

    const BlockHeader& header{block.header()};
    const intx::uint256 base_fee{header.base_fee_per_gas.value_or(0)};

    // Values the touched accounts had before the block, and their current values.
    std::map<evmc::address, std::optional<Account>> previous;
    std::map<evmc::address, std::optional<Account>> current;
    const auto touch = [&](const evmc::address& address) -> std::optional<Account>& {
        auto it{current.find(address)};
        if (it == current.end()) {
            std::optional<Account> account{read_account(address)};
            previous.emplace(address, account);
            it = current.emplace(address, std::move(account)).first;
        }
        return it->second;
    };

    execution::BlockExecutionResult result;
    const auto& transactions{block.block().transactions};
    for (size_t i{0}; i < transactions.size(); ++i) {
        const Transaction& txn{transactions[i]};
        const evmc::address& sender{block.senders()[i]};

        if (txn.max_fee_per_gas < base_fee) {
            throw BlockExecutionError{ExecutionErrorCode::kExecutionFailed, block_num,
                                      "max fee per gas below base fee in txn " + std::to_string(i)};
        }
        const uint64_t gas_used{intrinsic_gas(txn)};
        if (txn.gas_limit < gas_used) {
            throw BlockExecutionError{ExecutionErrorCode::kExecutionFailed, block_num,
                                      "intrinsic gas too low in txn " + std::to_string(i)};
        }
        const intx::uint256 gas_price{txn.effective_gas_price(base_fee)};

        std::optional<Account>& sender_account{touch(sender)};
        if (!sender_account || sender_account->nonce != txn.nonce) {
            throw BlockExecutionError{ExecutionErrorCode::kExecutionFailed, block_num,
                                      "wrong nonce in txn " + std::to_string(i)};
        }
        const intx::uint256 max_cost{intx::uint256{txn.gas_limit} * txn.max_fee_per_gas + txn.value};
        if (sender_account->balance < max_cost) {
            throw BlockExecutionError{ExecutionErrorCode::kExecutionFailed, block_num,
                                      "insufficient funds in txn " + std::to_string(i)};
        }
        sender_account->balance -= intx::uint256{gas_used} * gas_price + txn.value;
        ++sender_account->nonce;

        if (txn.to && txn.value != 0) {
            std::optional<Account>& recipient{touch(*txn.to)};
            if (!recipient) recipient = Account{};
            recipient->balance += txn.value;
        }
        const intx::uint256 reward{intx::uint256{gas_used} * (gas_price - base_fee)};
        if (reward != 0) {
            std::optional<Account>& beneficiary{touch(header.beneficiary)};
            if (!beneficiary) beneficiary = Account{};
            beneficiary->balance += reward;
        }

        result.gas_used += gas_used;
        result.receipts.push_back(Receipt{
            .type = txn.type,
            .success = true,
            .cumulative_gas_used = result.gas_used,
        });
    }

    if (block.block().withdrawals) {
        for (const Withdrawal& withdrawal : *block.block().withdrawals) {
            if (withdrawal.amount == 0) continue;
            std::optional<Account>& account{touch(withdrawal.address)};
            if (!account) account = Account{};
            account->balance += intx::uint256{withdrawal.amount} * kGiga;
        }
    }

    if (result.gas_used != header.gas_used) {
        throw BlockExecutionError{ExecutionErrorCode::kExecutionFailed, block_num,
                                  "gas used " + std::to_string(result.gas_used) + " header " +
                                      std::to_string(header.gas_used)};
    }

    std::vector<execution::AccountTransition> transitions;
    transitions.reserve(current.size());
    for (const auto& [address, account] : current) {
        transitions.push_back({.address = address, .previous_info = previous.at(address), .info = account});
        accounts_.insert_or_assign(address, account);
    }
    bundle_.apply_transitions(transitions);

    return result;
}

execution::BundleState TransferExecutor::take_bundle() {
    execution::BundleState bundle{std::move(bundle_)};
    bundle_ = {};
    return bundle;
}

}  // namespace spindle::test_util
