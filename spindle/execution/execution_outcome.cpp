// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "execution_outcome.hpp"

#include <iterator>
#include <string>
#include <utility>

#include <spindle/infra/common/ensure.hpp>

namespace spindle::execution {

ExecutionOutcome::ExecutionOutcome(BundleState bundle, std::vector<Receipts> receipts, BlockNum first_block)
    : bundle_{std::move(bundle)}, receipts_{std::move(receipts)}, first_block_{first_block} {}

ExecutionOutcome ExecutionOutcome::from_blocks(BlockNum first_block, BundleState bundle,
                                               std::vector<BlockExecutionResult> results) {
    std::vector<Receipts> receipts;
    receipts.reserve(results.size());
    for (auto& result : results) {
        receipts.push_back(std::move(result.receipts));
    }
    return ExecutionOutcome{std::move(bundle), std::move(receipts), first_block};
}

BlockNum ExecutionOutcome::last_block() const {
    ensure(!empty(), "last_block: empty execution outcome");
    return first_block_ + receipts_.size() - 1;
}

BlockRange ExecutionOutcome::block_range() const {
    return BlockRange{first_block_, last_block()};
}

const Receipts* ExecutionOutcome::receipts_by_block(BlockNum block_num) const {
    if (block_num < first_block_ || block_num - first_block_ >= receipts_.size()) {
        return nullptr;
    }
    return &receipts_[block_num - first_block_];
}

void ExecutionOutcome::prune_receipts(BlockNum block_num) {
    if (block_num < first_block_ || block_num - first_block_ >= receipts_.size()) {
        return;
    }
    Receipts{}.swap(receipts_[block_num - first_block_]);
}

std::optional<intx::uint256> ExecutionOutcome::balance_of(const evmc::address& address) const {
    const std::optional<Account> info{account(address)};
    if (!info) return std::nullopt;
    return info->balance;
}

void ExecutionOutcome::extend(ExecutionOutcome other) {
    if (other.empty()) return;
    if (empty()) {
        *this = std::move(other);
        return;
    }
    ensure_invariant(other.first_block_ == last_block() + 1, [&]() {
        return "cannot extend outcome ending at " + std::to_string(last_block()) +
               " with outcome starting at " + std::to_string(other.first_block_);
    });
    bundle_.extend(std::move(other.bundle_));
    receipts_.insert(receipts_.end(), std::make_move_iterator(other.receipts_.begin()),
                     std::make_move_iterator(other.receipts_.end()));
}

}  // namespace spindle::execution
