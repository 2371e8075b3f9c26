// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <utility>

#include <spindle/backfill/block_fetcher.hpp>
#include <spindle/backfill/thresholds.hpp>
#include <spindle/chain/chain.hpp>
#include <spindle/core/common/block_range.hpp>
#include <spindle/core/types/recovered_block.hpp>
#include <spindle/db/provider.hpp>
#include <spindle/db/prune_mode.hpp>
#include <spindle/execution/block_executor.hpp>
#include <spindle/execution/execution_outcome.hpp>

namespace spindle::backfill {

template <class Job>
class StreamBackfillJob;

class SingleBlockBackfillJob;

//! \brief Re-executes a block range in batches bounded by ExecutionThresholds
//! \details Each call to next() executes the blocks following the previous batch until a threshold is reached
//! and returns them as one Chain. Receipt pruning distances are measured from the best block of the provider
//! when the job is created, not from the end of the range. Failures throw execution::BlockExecutionError and leave the remaining range
//! untouched, so next() may be called again once the cause is fixed.
class BackfillJob {
  public:
    BackfillJob(std::shared_ptr<const execution::BlockExecutorProvider> executor_provider,
                std::shared_ptr<db::ChainProvider> provider, db::PruneMode prune_mode, ExecutionThresholds thresholds,
                BlockRange range, size_t stream_parallelism, SenderRecoveryMode sender_recovery);

    BackfillJob(BackfillJob&&) = default;
    BackfillJob& operator=(BackfillJob&&) = default;

    //! \return The next batch, nullopt when the range is exhausted
    //! \throws execution::BlockExecutionError
    std::optional<chain::Chain> next();

    //! \brief Blocks still to be executed
    const BlockRange& range() const { return range_; }

    SingleBlockBackfillJob into_single_blocks() &&;
    StreamBackfillJob<BackfillJob> into_stream() &&;

    //! \brief Fetches the remaining blocks ahead of execution, stream_parallelism at a time
    void enable_prefetch();

  private:
    chain::Chain execute_range();

    std::shared_ptr<const execution::BlockExecutorProvider> executor_provider_;
    std::shared_ptr<db::ChainProvider> provider_;
    BlockNum chain_head_;
    db::PruneMode prune_mode_;
    ExecutionThresholds thresholds_;
    BlockRange range_;
    size_t stream_parallelism_;
    SenderRecoveryMode sender_recovery_;
    std::unique_ptr<BlockFetcher> fetcher_;
};

//! A block together with the output of executing it alone
using ExecutedBlockOutput = std::pair<RecoveredBlock, execution::BlockExecutionOutput>;

//! \brief Re-executes a block range one block at a time, each on a fresh execution session
//! \details next() consumes one block number even when its execution fails
class SingleBlockBackfillJob {
  public:
    SingleBlockBackfillJob(std::shared_ptr<const execution::BlockExecutorProvider> executor_provider,
                           std::shared_ptr<db::ChainProvider> provider, BlockRange range, size_t stream_parallelism,
                           SenderRecoveryMode sender_recovery);

    SingleBlockBackfillJob(SingleBlockBackfillJob&&) = default;
    SingleBlockBackfillJob& operator=(SingleBlockBackfillJob&&) = default;

    //! \return The next executed block, nullopt when the range is exhausted
    //! \throws execution::BlockExecutionError
    std::optional<ExecutedBlockOutput> next();

    //! \brief Executes the given block on top of the state of its parent
    //! \throws execution::BlockExecutionError
    ExecutedBlockOutput execute_block(BlockNum block_num);

    const BlockRange& range() const { return range_; }

    StreamBackfillJob<SingleBlockBackfillJob> into_stream() &&;

    //! \brief Fetches the remaining blocks ahead of execution, stream_parallelism at a time
    void enable_prefetch();

  private:
    std::shared_ptr<const execution::BlockExecutorProvider> executor_provider_;
    std::shared_ptr<db::ChainProvider> provider_;
    BlockRange range_;
    size_t stream_parallelism_;
    SenderRecoveryMode sender_recovery_;
    std::unique_ptr<BlockFetcher> fetcher_;
};

}  // namespace spindle::backfill
