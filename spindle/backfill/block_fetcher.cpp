// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_fetcher.hpp"

#include <algorithm>
#include <string>

#include <boost/asio/post.hpp>

#include <spindle/db/provider_error.hpp>
#include <spindle/execution/execution_error.hpp>
#include <spindle/infra/common/ensure.hpp>
#include <spindle/infra/common/log.hpp>

namespace spindle::backfill {

using execution::BlockExecutionError;
using execution::ExecutionErrorCode;

static tl::expected<RecoveredBlock, db::BlockReadError> read_block(const db::BlockReader& provider, BlockNum block_num,
                                                                  SenderRecoveryMode mode) {
    try {
        return provider.recovered_block(block_num, db::TransactionVariant::kWithHash, mode);
    } catch (const db::ProviderError& ex) {
        throw BlockExecutionError{ExecutionErrorCode::kProviderFailure, block_num, ex.what()};
    }
}

RecoveredBlock fetch_recovered_block(const db::BlockReader& provider, BlockNum block_num, SenderRecoveryMode mode) {
    tl::expected<RecoveredBlock, db::BlockReadError> result{read_block(provider, block_num, mode)};
    if (!result) {
        if (result.error().kind == db::BlockReadError::Kind::kNotFound) {
            throw BlockExecutionError{ExecutionErrorCode::kBlockNotFound, block_num};
        }
        throw BlockExecutionError{ExecutionErrorCode::kInvalidSignature, block_num,
                                  "cannot recover sender of txn " + std::to_string(result.error().txn_index)};
    }
    return std::move(*result);
}

BlockPrefetcher::BlockPrefetcher(std::shared_ptr<db::ChainProvider> provider, SenderRecoveryMode mode,
                                 BlockRange range, size_t parallelism)
    : provider_{std::move(provider)},
      mode_{mode},
      range_{range},
      parallelism_{std::max<size_t>(parallelism, 1)},
      workers_{parallelism_},
      next_to_issue_{range.start()} {}

BlockPrefetcher::~BlockPrefetcher() {
    for (auto& [_, future] : in_flight_) {
        future.wait();
    }
    workers_.join();
}

void BlockPrefetcher::reset(BlockNum block_num) {
    SPINDLE_TRACE_M("BlockPrefetcher", {"op", "reset", "block", std::to_string(block_num),
                                        "dropped", std::to_string(in_flight_.size())});
    for (auto& [_, future] : in_flight_) {
        future.wait();
    }
    in_flight_.clear();
    next_to_issue_ = block_num;
}

void BlockPrefetcher::fill_window() {
    while (in_flight_.size() < parallelism_ && next_to_issue_ <= range_.end()) {
        const BlockNum block_num{next_to_issue_++};
        std::packaged_task<RecoveredBlock()> task{[provider = provider_, mode = mode_, block_num]() {
            log::set_thread_name("prefetch");
            return fetch_recovered_block(*provider, block_num, mode);
        }};
        in_flight_.emplace_back(block_num, task.get_future());
        boost::asio::post(workers_, std::move(task));
    }
}

RecoveredBlock BlockPrefetcher::fetch(BlockNum block_num) {
    ensure_pre_condition(range_.contains(block_num), [&]() {
        return "block " + std::to_string(block_num) + " outside prefetch range " + range_.to_string();
    });
    if (in_flight_.empty() ? next_to_issue_ != block_num : in_flight_.front().first != block_num) {
        reset(block_num);
    }
    fill_window();

    std::future<RecoveredBlock> future{std::move(in_flight_.front().second)};
    in_flight_.pop_front();
    fill_window();

    return future.get();
}

}  // namespace spindle::backfill
