// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <future>
#include <memory>
#include <utility>

#include <boost/asio/thread_pool.hpp>

#include <spindle/core/common/block_range.hpp>
#include <spindle/core/types/recovered_block.hpp>
#include <spindle/db/provider.hpp>

namespace spindle::backfill {

//! \brief Reads a block with its transaction hashes and senders, recovering senders when not stored
//! \throws execution::BlockExecutionError with kBlockNotFound, kInvalidSignature or kProviderFailure
RecoveredBlock fetch_recovered_block(const db::BlockReader& provider, BlockNum block_num, SenderRecoveryMode mode);

//! Source of the blocks executed by a backfill job
class BlockFetcher {
  public:
    virtual ~BlockFetcher() = default;

    //! \throws execution::BlockExecutionError when the block cannot be provided
    virtual RecoveredBlock fetch(BlockNum block_num) = 0;
};

//! Fetches each block when asked for it
class DirectBlockFetcher : public BlockFetcher {
  public:
    DirectBlockFetcher(std::shared_ptr<db::ChainProvider> provider, SenderRecoveryMode mode)
        : provider_{std::move(provider)}, mode_{mode} {}

    RecoveredBlock fetch(BlockNum block_num) override {
        return fetch_recovered_block(*provider_, block_num, mode_);
    }

  private:
    std::shared_ptr<db::ChainProvider> provider_;
    SenderRecoveryMode mode_;
};

//! \brief Fetches up to parallelism blocks ahead of the one being requested on a worker pool
//! \details Blocks are handed out in request order and fetches never go past the end of the range.
//! Requesting a block other than the one following the previous request drops the lookahead window.
//! Destruction waits for the fetches in flight.
class BlockPrefetcher : public BlockFetcher {
  public:
    BlockPrefetcher(std::shared_ptr<db::ChainProvider> provider, SenderRecoveryMode mode, BlockRange range,
                    size_t parallelism);
    ~BlockPrefetcher() override;

    BlockPrefetcher(const BlockPrefetcher&) = delete;
    BlockPrefetcher& operator=(const BlockPrefetcher&) = delete;

    RecoveredBlock fetch(BlockNum block_num) override;

    size_t in_flight() const { return in_flight_.size(); }

  private:
    void reset(BlockNum block_num);
    void fill_window();

    std::shared_ptr<db::ChainProvider> provider_;
    SenderRecoveryMode mode_;
    BlockRange range_;
    size_t parallelism_;
    boost::asio::thread_pool workers_;
    std::deque<std::pair<BlockNum, std::future<RecoveredBlock>>> in_flight_;
    BlockNum next_to_issue_;
};

}  // namespace spindle::backfill
