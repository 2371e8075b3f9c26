// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "backfill_job.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <vector>

#include <absl/strings/str_format.h>

#include <spindle/backfill/stream_job.hpp>
#include <spindle/db/provider_error.hpp>
#include <spindle/execution/execution_error.hpp>
#include <spindle/infra/common/ensure.hpp>
#include <spindle/infra/common/log.hpp>
#include <spindle/infra/common/stopwatch.hpp>

namespace spindle::backfill {

using execution::BlockExecutionError;
using execution::ExecutionErrorCode;

//! Opens an execution session on the state right before first_block
static std::unique_ptr<execution::BlockExecutor> open_session(const execution::BlockExecutorProvider& executor_provider,
                                                              const db::StateProviderFactory& provider,
                                                              BlockNum first_block) {
    const BlockNum state_block{first_block == 0 ? 0 : first_block - 1};
    std::unique_ptr<db::StateView> state;
    try {
        state = provider.history_by_block_number(state_block);
    } catch (const db::ProviderError& ex) {
        throw BlockExecutionError{ExecutionErrorCode::kStateUnavailable, state_block, ex.what()};
    }
    if (!state) {
        throw BlockExecutionError{ExecutionErrorCode::kStateUnavailable, state_block};
    }
    return executor_provider.executor(std::move(state));
}

static execution::BlockExecutionResult execute_one(execution::BlockExecutor& executor, const RecoveredBlock& block) {
    try {
        return executor.execute_one(block);
    } catch (const BlockExecutionError&) {
        throw;
    } catch (const std::exception& ex) {
        throw BlockExecutionError{ExecutionErrorCode::kExecutionFailed, block.number(), ex.what()};
    }
}

static std::string gas_throughput(uint64_t gas, StopWatch::Duration duration) {
    const auto seconds{std::chrono::duration<double>(duration).count()};
    return absl::StrFormat("%.2f", seconds > 0 ? static_cast<double>(gas) / seconds / 1'000'000 : 0.0);
}

BackfillJob::BackfillJob(std::shared_ptr<const execution::BlockExecutorProvider> executor_provider,
                         std::shared_ptr<db::ChainProvider> provider, db::PruneMode prune_mode,
                         ExecutionThresholds thresholds, BlockRange range, size_t stream_parallelism,
                         SenderRecoveryMode sender_recovery)
    : executor_provider_{std::move(executor_provider)},
      provider_{std::move(provider)},
      chain_head_{provider_->best_block_number()},
      prune_mode_{prune_mode},
      thresholds_{std::move(thresholds)},
      range_{range},
      stream_parallelism_{stream_parallelism},
      sender_recovery_{sender_recovery},
      fetcher_{std::make_unique<DirectBlockFetcher>(provider_, sender_recovery_)} {}

std::optional<chain::Chain> BackfillJob::next() {
    if (range_.empty()) {
        return std::nullopt;
    }
    return execute_range();
}

chain::Chain BackfillJob::execute_range() {
    SPINDLE_DEBUG_M("BackfillJob", {"op", "execute", "range", range_.to_string()});

    std::unique_ptr<execution::BlockExecutor> executor{open_session(*executor_provider_, *provider_, range_.start())};

    StopWatch::Duration fetch_duration{0};
    StopWatch::Duration execution_duration{0};
    uint64_t cumulative_gas{0};
    StopWatch batch_stopwatch{StopWatch::kStart};

    std::vector<RecoveredBlock> blocks;
    std::vector<execution::BlockExecutionResult> results;
    for (BlockNum block_num{range_.start()}; block_num <= range_.end(); ++block_num) {
        StopWatch fetch_stopwatch{StopWatch::kStart};
        RecoveredBlock block{fetcher_->fetch(block_num)};
        fetch_duration += fetch_stopwatch.since_start();

        cumulative_gas += block.header().gas_used;

        SPINDLE_TRACE_M("BackfillJob", {"op", "execute block", "number", std::to_string(block_num),
                                        "txs", std::to_string(block.block().transactions.size())});

        StopWatch execution_stopwatch{StopWatch::kStart};
        execution::BlockExecutionResult result{execute_one(*executor, block)};
        execution_duration += execution_stopwatch.since_start();

        blocks.push_back(std::move(block));
        results.push_back(std::move(result));

        if (thresholds_.is_end_of_batch(blocks.size(), executor->size_hint(), cumulative_gas,
                                        batch_stopwatch.since_start())) {
            break;
        }
    }

    const BlockNum first_block_num{blocks.front().number()};
    const BlockNum last_block_num{blocks.back().number()};
    SPINDLE_DEBUG_M("BackfillJob", {"op", "executed", "range", BlockRange{first_block_num, last_block_num}.to_string(),
                                    "fetch", StopWatch::format(fetch_duration),
                                    "execution", StopWatch::format(execution_duration),
                                    "Mgas/s", gas_throughput(cumulative_gas, execution_duration)});

    execution::ExecutionOutcome outcome{
        execution::ExecutionOutcome::from_blocks(first_block_num, executor->take_bundle(), std::move(results))};
    for (BlockNum block_num{first_block_num}; block_num <= last_block_num; ++block_num) {
        if (prune_mode_.receipts().should_prune(block_num, chain_head_)) {
            outcome.prune_receipts(block_num);
        }
    }
    chain::Chain chain{std::move(blocks), std::move(outcome)};
    range_.advance_to(last_block_num + 1);
    return chain;
}

SingleBlockBackfillJob BackfillJob::into_single_blocks() && {
    return SingleBlockBackfillJob{std::move(executor_provider_), std::move(provider_), range_, stream_parallelism_,
                                  sender_recovery_};
}

StreamBackfillJob<BackfillJob> BackfillJob::into_stream() && {
    return StreamBackfillJob<BackfillJob>{std::move(*this)};
}

void BackfillJob::enable_prefetch() {
    if (range_.empty()) return;
    fetcher_ = std::make_unique<BlockPrefetcher>(provider_, sender_recovery_, range_, stream_parallelism_);
}

SingleBlockBackfillJob::SingleBlockBackfillJob(std::shared_ptr<const execution::BlockExecutorProvider> executor_provider,
                                               std::shared_ptr<db::ChainProvider> provider, BlockRange range,
                                               size_t stream_parallelism, SenderRecoveryMode sender_recovery)
    : executor_provider_{std::move(executor_provider)},
      provider_{std::move(provider)},
      range_{range},
      stream_parallelism_{stream_parallelism},
      sender_recovery_{sender_recovery},
      fetcher_{std::make_unique<DirectBlockFetcher>(provider_, sender_recovery_)} {}

std::optional<ExecutedBlockOutput> SingleBlockBackfillJob::next() {
    if (range_.empty()) {
        return std::nullopt;
    }
    const BlockNum block_num{range_.start()};
    range_.advance_to(block_num + 1);
    return execute_block(block_num);
}

ExecutedBlockOutput SingleBlockBackfillJob::execute_block(BlockNum block_num) {
    RecoveredBlock block{fetcher_->fetch(block_num)};

    SPINDLE_TRACE_M("SingleBlockBackfillJob", {"op", "execute block", "number", std::to_string(block_num),
                                               "txs", std::to_string(block.block().transactions.size())});

    std::unique_ptr<execution::BlockExecutor> executor{open_session(*executor_provider_, *provider_, block_num)};
    execution::BlockExecutionResult result{execute_one(*executor, block)};
    execution::BlockExecutionOutput output{std::move(result), executor->take_bundle()};
    return {std::move(block), std::move(output)};
}

StreamBackfillJob<SingleBlockBackfillJob> SingleBlockBackfillJob::into_stream() && {
    return StreamBackfillJob<SingleBlockBackfillJob>{std::move(*this)};
}

void SingleBlockBackfillJob::enable_prefetch() {
    if (range_.empty()) return;
    fetcher_ = std::make_unique<BlockPrefetcher>(provider_, sender_recovery_, range_, stream_parallelism_);
}

}  // namespace spindle::backfill
