// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_fetcher.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <spindle/execution/execution_error.hpp>
#include <spindle/test_util/in_memory_provider.hpp>
#include <spindle/test_util/test_block_builder.hpp>

namespace spindle::backfill {

using execution::BlockExecutionError;
using execution::ExecutionErrorCode;

static std::shared_ptr<test_util::InMemoryChainProvider> make_provider(size_t num_blocks) {
    auto provider{std::make_shared<test_util::InMemoryChainProvider>()};
    test_util::TestBlockBuilder builder;
    builder.populate(*provider, num_blocks, /*txs_per_block=*/1);
    return provider;
}

static std::vector<BlockNum> sorted(std::vector<BlockNum> numbers) {
    std::sort(numbers.begin(), numbers.end());
    return numbers;
}

TEST_CASE("fetch_recovered_block", "[backfill][block_fetcher]") {
    auto provider{make_provider(2)};

    const RecoveredBlock block{fetch_recovered_block(*provider, 1, SenderRecoveryMode::kChecked)};
    CHECK(block.number() == 1);
    CHECK(block.senders().size() == 1);
    CHECK(block.transaction_hashes());

    try {
        fetch_recovered_block(*provider, 3, SenderRecoveryMode::kChecked);
        FAIL("missing block must throw");
    } catch (const BlockExecutionError& ex) {
        CHECK(ex.code() == ExecutionErrorCode::kBlockNotFound);
        CHECK(ex.block_num() == 3);
    }
}

TEST_CASE("BlockPrefetcher hands out blocks in order", "[backfill][block_fetcher]") {
    auto provider{make_provider(10)};
    {
        BlockPrefetcher prefetcher{provider, SenderRecoveryMode::kChecked, BlockRange{1, 10}, 3};
        for (BlockNum block_num{1}; block_num <= 10; ++block_num) {
            CHECK(prefetcher.fetch(block_num).number() == block_num);
            CHECK(prefetcher.in_flight() <= 3);
        }
        CHECK(prefetcher.in_flight() == 0);
    }
    CHECK(sorted(provider->fetched_blocks()) == std::vector<BlockNum>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
}

TEST_CASE("BlockPrefetcher stays within window and range", "[backfill][block_fetcher]") {
    auto provider{make_provider(10)};

    SECTION("window") {
        {
            BlockPrefetcher prefetcher{provider, SenderRecoveryMode::kChecked, BlockRange{1, 10}, 2};
            CHECK(prefetcher.fetch(1).number() == 1);
            CHECK(prefetcher.in_flight() == 2);
        }
        CHECK(sorted(provider->fetched_blocks()) == std::vector<BlockNum>{1, 2, 3});
    }

    SECTION("range end") {
        {
            BlockPrefetcher prefetcher{provider, SenderRecoveryMode::kChecked, BlockRange{4, 5}, 8};
            CHECK(prefetcher.fetch(4).number() == 4);
            CHECK(prefetcher.in_flight() == 1);
        }
        CHECK(sorted(provider->fetched_blocks()) == std::vector<BlockNum>{4, 5});
    }
}

TEST_CASE("BlockPrefetcher resets on out of order requests", "[backfill][block_fetcher]") {
    auto provider{make_provider(10)};
    {
        BlockPrefetcher prefetcher{provider, SenderRecoveryMode::kChecked, BlockRange{1, 10}, 2};
        CHECK(prefetcher.fetch(1).number() == 1);
        CHECK(prefetcher.fetch(1).number() == 1);
        CHECK(prefetcher.fetch(6).number() == 6);
        CHECK(prefetcher.fetch(7).number() == 7);
    }
    CHECK(sorted(provider->fetched_blocks()) == std::vector<BlockNum>{1, 1, 2, 2, 3, 3, 6, 7, 8, 9});
}

TEST_CASE("BlockPrefetcher propagates fetch errors", "[backfill][block_fetcher]") {
    auto provider{make_provider(5)};
    provider->fail_fetch_at(3);

    BlockPrefetcher prefetcher{provider, SenderRecoveryMode::kChecked, BlockRange{1, 5}, 4};
    CHECK(prefetcher.fetch(1).number() == 1);
    CHECK(prefetcher.fetch(2).number() == 2);
    try {
        prefetcher.fetch(3);
        FAIL("failing fetch must throw");
    } catch (const BlockExecutionError& ex) {
        CHECK(ex.code() == ExecutionErrorCode::kProviderFailure);
        CHECK(ex.block_num() == 3);
    }
    CHECK(prefetcher.fetch(4).number() == 4);
}

}  // namespace spindle::backfill
