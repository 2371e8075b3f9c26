// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/common/base.hpp>
#include <spindle/core/common/block_range.hpp>
#include <spindle/core/types/account.hpp>
#include <spindle/core/types/receipt.hpp>
#include <spindle/execution/bundle_state.hpp>

namespace spindle::execution {

//! Result of executing one block: its receipts and the total gas it used
struct BlockExecutionResult {
    Receipts receipts;
    uint64_t gas_used{0};

    friend bool operator==(const BlockExecutionResult&, const BlockExecutionResult&) = default;
};

//! Result of executing a single block together with the state diff it produced
struct BlockExecutionOutput {
    BlockExecutionResult result;
    BundleState state;

    friend bool operator==(const BlockExecutionOutput&, const BlockExecutionOutput&) = default;
};

//! Aggregated outcome of executing a contiguous sequence of blocks starting at first_block
class ExecutionOutcome {
  public:
    ExecutionOutcome() = default;

    //! \param receipts one receipt list per block, in block order
    ExecutionOutcome(BundleState bundle, std::vector<Receipts> receipts, BlockNum first_block);

    static ExecutionOutcome from_blocks(BlockNum first_block, BundleState bundle, std::vector<BlockExecutionResult> results);

    const BundleState& bundle() const { return bundle_; }
    const std::vector<Receipts>& receipts() const { return receipts_; }

    BlockNum first_block() const { return first_block_; }

    //! \pre !empty()
    BlockNum last_block() const;

    //! \pre !empty()
    BlockRange block_range() const;

    size_t len() const { return receipts_.size(); }
    bool empty() const { return receipts_.empty(); }

    //! \return receipts of the given block, nullptr if outside the outcome
    const Receipts* receipts_by_block(BlockNum block_num) const;

    //! \brief Drops the receipts of the given block, keeping an empty list in its slot
    void prune_receipts(BlockNum block_num);

    std::optional<Account> account(const evmc::address& address) const { return bundle_.account_info(address); }
    std::optional<intx::uint256> balance_of(const evmc::address& address) const;

    //! \brief Appends the outcome of the blocks following this one
    //! \throws std::logic_error if other does not start right after last_block()
    void extend(ExecutionOutcome other);

    friend bool operator==(const ExecutionOutcome&, const ExecutionOutcome&) = default;

  private:
    BundleState bundle_;
    std::vector<Receipts> receipts_;
    BlockNum first_block_{0};
};

}  // namespace spindle::execution
