// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "backfill_job.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <spindle/backfill/factory.hpp>
#include <spindle/backfill/stream_job.hpp>
#include <spindle/execution/execution_error.hpp>
#include <spindle/infra/test_util/log.hpp>
#include <spindle/test_util/in_memory_provider.hpp>
#include <spindle/test_util/test_block_builder.hpp>
#include <spindle/test_util/transfer_executor.hpp>

namespace spindle::backfill {

using execution::BlockExecutionError;
using execution::ExecutionErrorCode;

namespace {

    class BackfillTest {
      public:
        explicit BackfillTest(size_t num_blocks, size_t txs_per_block = 1)
            : blocks_{builder_.populate(*provider_, num_blocks, txs_per_block)} {}

        BackfillJobFactory factory(BackfillSettings settings = {}) const {
            return BackfillJobFactory{executor_provider_, provider_, std::move(settings)};
        }

        void fail_execution_at(BlockNum block_num) {
            executor_provider_ = std::make_shared<test_util::TransferExecutorProvider>(block_num);
        }

        test_util::InMemoryChainProvider& provider() { return *provider_; }
        test_util::TestBlockBuilder& builder() { return builder_; }
        const std::vector<SealedBlock>& blocks() const { return blocks_; }

      private:
        test_util::SetLogVerbosityGuard log_guard_{log::Level::kNone};
        std::shared_ptr<test_util::InMemoryChainProvider> provider_{std::make_shared<test_util::InMemoryChainProvider>()};
        std::shared_ptr<const execution::BlockExecutorProvider> executor_provider_{
            std::make_shared<test_util::TransferExecutorProvider>()};
        test_util::TestBlockBuilder builder_;
        std::vector<SealedBlock> blocks_;
    };

    BackfillSettings max_blocks_settings(uint64_t max_blocks) {
        BackfillSettings settings;
        settings.thresholds.max_blocks = max_blocks;
        return settings;
    }

    template <class Job>
    std::vector<chain::Chain> collect_batches(Job& job) {
        std::vector<chain::Chain> batches;
        while (auto batch = job.next()) {
            batches.push_back(std::move(*batch));
        }
        return batches;
    }

    template <class Function>
    BlockExecutionError capture_error(Function&& function) {
        try {
            function();
        } catch (const BlockExecutionError& ex) {
            return ex;
        }
        FAIL("BlockExecutionError expected");
        throw std::logic_error{"unreachable"};
    }

}  // namespace

TEST_CASE("Backfill single block balance", "[backfill][backfill_job]") {
    BackfillTest test{1};
    BackfillJob job{test.factory().backfill(1, 1)};

    std::optional<chain::Chain> batch{job.next()};
    REQUIRE(batch);
    CHECK(batch->size() == 1);
    CHECK(batch->first().number() == 1);
    CHECK(batch->first().senders() == std::vector<evmc::address>{test.builder().signer()});
    CHECK(batch->execution_outcome().first_block() == 1);
    CHECK(batch->execution_outcome().receipts().size() == 1);
    CHECK(batch->execution_outcome().balance_of(test.builder().signer()) ==
          test_util::TestBlockBuilder::initial_balance() - test_util::TestBlockBuilder::single_tx_cost());
    CHECK(batch->execution_outcome().account(test.builder().signer())->nonce == 1);

    CHECK_FALSE(job.next());
    CHECK(job.range().empty());
}

TEST_CASE("Backfill covers the range exactly once", "[backfill][backfill_job]") {
    BackfillTest test{10, 2};

    for (const uint64_t max_blocks : {1u, 2u, 3u, 7u, 10u, 100u}) {
        BackfillJob job{test.factory(max_blocks_settings(max_blocks)).backfill(1, 10)};
        const std::vector<chain::Chain> batches{collect_batches(job)};

        std::vector<BlockNum> executed;
        for (const chain::Chain& batch : batches) {
            CHECK(batch.size() <= max_blocks);
            CHECK(batch.execution_outcome().first_block() == batch.first().number());
            CHECK(batch.execution_outcome().len() == batch.size());
            for (const auto& [block_num, _] : batch.blocks()) {
                executed.push_back(block_num);
            }
        }
        CHECK(executed == std::vector<BlockNum>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        CHECK(batches.back().execution_outcome().balance_of(test.builder().signer()) ==
              test.builder().signer_account().balance);
    }
}

TEST_CASE("Backfill with unit batches", "[backfill][backfill_job]") {
    BackfillTest test{5};
    BackfillJob job{test.factory(max_blocks_settings(1)).backfill(1, 5)};
    const std::vector<chain::Chain> batches{collect_batches(job)};

    REQUIRE(batches.size() == 5);
    for (size_t i{0}; i < batches.size(); ++i) {
        CHECK(batches[i].size() == 1);
        CHECK(batches[i].first().number() == i + 1);
    }
}

TEST_CASE("Backfill single blocks match unit batches", "[backfill][backfill_job]") {
    BackfillTest test{6, 3};
    BackfillJob batch_job{test.factory(max_blocks_settings(1)).backfill(1, 6)};
    const std::vector<chain::Chain> batches{collect_batches(batch_job)};

    SingleBlockBackfillJob single_job{test.factory().backfill(1, 6).into_single_blocks()};
    std::vector<ExecutedBlockOutput> outputs;
    while (auto output = single_job.next()) {
        outputs.push_back(std::move(*output));
    }

    REQUIRE(outputs.size() == batches.size());
    for (size_t i{0}; i < outputs.size(); ++i) {
        const auto& [block, output] = outputs[i];
        CHECK(block == batches[i].first());
        CHECK(output.result.receipts == batches[i].execution_outcome().receipts().front());
        CHECK(output.state == batches[i].execution_outcome().bundle());
    }
}

TEST_CASE("Backfill batches closed by gas and changes", "[backfill][backfill_job]") {
    BackfillTest test{6};

    SECTION("cumulative gas") {
        BackfillSettings settings;
        settings.thresholds.max_cumulative_gas = 2 * kMinTransactionGas;
        BackfillJob job{test.factory(settings).backfill(1, 6)};
        const std::vector<chain::Chain> batches{collect_batches(job)};
        REQUIRE(batches.size() == 3);
        CHECK(batches[0].range() == BlockRange{1, 2});
        CHECK(batches[2].range() == BlockRange{5, 6});
    }

    SECTION("state changes") {
        BackfillSettings settings;
        settings.thresholds.max_changes = 1;
        BackfillJob job{test.factory(settings).backfill(1, 6)};
        CHECK(collect_batches(job).size() == 6);
    }
}

TEST_CASE("Backfill errors", "[backfill][backfill_job]") {
    BackfillTest test{5};

    SECTION("missing block") {
        test.provider().remove_block(3);
        BackfillJob job{test.factory().backfill(1, 5)};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kBlockNotFound);
        CHECK(error.block_num() == 3);
        CHECK(job.range() == BlockRange{1, 5});

        test.provider().replace_block(test.blocks()[2]);
        std::optional<chain::Chain> batch{job.next()};
        REQUIRE(batch);
        CHECK(batch->range() == BlockRange{1, 5});
    }

    SECTION("unavailable state") {
        test.provider().drop_state_at(2);
        BackfillJob job{test.factory().backfill(3, 5)};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kStateUnavailable);
        CHECK(error.block_num() == 2);
    }

    SECTION("state backend failure") {
        test.provider().fail_state_at(0);
        BackfillJob job{test.factory().backfill(1, 5)};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kStateUnavailable);
        CHECK(error.block_num() == 0);
    }

    SECTION("execution failure") {
        test.fail_execution_at(4);
        BackfillJob job{test.factory().backfill(1, 5)};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kExecutionFailed);
        CHECK(error.block_num() == 4);
        CHECK(error.cause() == "injected execution failure");
        CHECK(job.range() == BlockRange{1, 5});
    }

    SECTION("provider failure") {
        test.provider().fail_fetch_at(2);
        BackfillJob job{test.factory().backfill(1, 5)};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kProviderFailure);
        CHECK(error.block_num() == 2);
    }

    SECTION("invalid signature") {
        Block tampered{test.blocks()[1].block};
        tampered.transactions.front().r = 0;
        test.provider().replace_block(SealedBlock::seal_slow(std::move(tampered)));
        for (const SenderRecoveryMode mode : {SenderRecoveryMode::kChecked, SenderRecoveryMode::kUnchecked}) {
            BackfillSettings settings;
            settings.sender_recovery = mode;
            BackfillJob job{test.factory(settings).backfill(1, 5)};
            const BlockExecutionError error{capture_error([&] { job.next(); })};
            CHECK(error.code() == ExecutionErrorCode::kInvalidSignature);
            CHECK(error.block_num() == 2);
        }
    }
}

TEST_CASE("Single block backfill errors", "[backfill][backfill_job]") {
    BackfillTest test{5};

    SECTION("missing block consumes its number") {
        test.provider().remove_block(3);
        SingleBlockBackfillJob job{test.factory().backfill(1, 5).into_single_blocks()};
        REQUIRE(job.next());
        REQUIRE(job.next());
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kBlockNotFound);
        CHECK(error.block_num() == 3);
        CHECK(job.range().start() == 4);

        std::optional<ExecutedBlockOutput> output{job.next()};
        REQUIRE(output);
        CHECK(output->first.number() == 4);
    }

    SECTION("unavailable parent state") {
        test.provider().drop_state_at(2);
        SingleBlockBackfillJob job{test.factory().backfill(3, 5).into_single_blocks()};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kStateUnavailable);
        CHECK(error.block_num() == 2);
        CHECK(job.range().start() == 4);
    }

    SECTION("execution failure") {
        test.fail_execution_at(4);
        SingleBlockBackfillJob job{test.factory().backfill(4, 5).into_single_blocks()};
        const BlockExecutionError error{capture_error([&] { job.next(); })};
        CHECK(error.code() == ExecutionErrorCode::kExecutionFailed);
        CHECK(error.block_num() == 4);
        CHECK(error.cause() == "injected execution failure");
        CHECK(job.range().start() == 5);

        std::optional<ExecutedBlockOutput> output{job.next()};
        REQUIRE(output);
        CHECK(output->first.number() == 5);
        CHECK_FALSE(job.next());
    }

    SECTION("execute_block leaves the range untouched") {
        test.provider().remove_block(2);
        SingleBlockBackfillJob job{test.factory().backfill(1, 5).into_single_blocks()};
        const BlockExecutionError error{capture_error([&] { job.execute_block(2); })};
        CHECK(error.code() == ExecutionErrorCode::kBlockNotFound);
        CHECK(error.block_num() == 2);
        CHECK(job.range() == BlockRange{1, 5});
    }
}

TEST_CASE("Backfill recovery modes agree on low-s signatures", "[backfill][backfill_job]") {
    BackfillTest test{4, 2};

    BackfillSettings unchecked;
    unchecked.sender_recovery = SenderRecoveryMode::kUnchecked;
    BackfillJob checked_job{test.factory().backfill(1, 4)};
    BackfillJob unchecked_job{test.factory(unchecked).backfill(1, 4)};

    CHECK(collect_batches(checked_job) == collect_batches(unchecked_job));
}

TEST_CASE("Backfill uses stored senders", "[backfill][backfill_job]") {
    BackfillTest test{2};
    const std::vector<evmc::address> senders{test.builder().signer()};
    test.provider().insert_senders(1, senders);
    test.provider().insert_senders(2, senders);

    BackfillJob job{test.factory().backfill(1, 2)};
    std::optional<chain::Chain> batch{job.next()};
    REQUIRE(batch);
    CHECK(batch->tip().senders() == senders);
    REQUIRE(batch->tip().transaction_hashes());
    CHECK(batch->tip().transaction_hashes()->size() == 1);
}

TEST_CASE("Backfill receipt pruning", "[backfill][backfill_job]") {
    BackfillTest test{5};

    BackfillSettings settings;
    settings.prune_mode = db::parse_prune_mode("", std::nullopt, /*before_receipts=*/3);
    BackfillJob job{test.factory(settings).backfill(1, 5)};
    std::optional<chain::Chain> batch{job.next()};
    REQUIRE(batch);

    const execution::ExecutionOutcome& outcome{batch->execution_outcome()};
    REQUIRE(outcome.len() == 5);
    CHECK(outcome.receipts_by_block(1)->empty());
    CHECK(outcome.receipts_by_block(2)->empty());
    CHECK(outcome.receipts_by_block(3)->size() == 1);
    CHECK(outcome.receipts_by_block(5)->size() == 1);
}

TEST_CASE("Backfill receipt pruning is measured from the chain head", "[backfill][backfill_job]") {
    BackfillTest test{10};

    BackfillSettings settings;
    settings.prune_mode = db::parse_prune_mode("r", /*older_receipts=*/5, std::nullopt);

    BackfillJob partial_job{test.factory(settings).backfill(1, 3)};
    std::optional<chain::Chain> partial{partial_job.next()};
    REQUIRE(partial);
    REQUIRE(partial->execution_outcome().len() == 3);
    for (BlockNum block_num{1}; block_num <= 3; ++block_num) {
        CHECK(partial->execution_outcome().receipts_by_block(block_num)->empty());
    }

    BackfillJob full_job{test.factory(settings).backfill(1, 10)};
    std::optional<chain::Chain> full{full_job.next()};
    REQUIRE(full);
    const execution::ExecutionOutcome& outcome{full->execution_outcome()};
    REQUIRE(outcome.len() == 10);
    CHECK(outcome.receipts_by_block(2)->empty());
    CHECK(outcome.receipts_by_block(4)->empty());
    CHECK(outcome.receipts_by_block(5)->size() == 1);
    CHECK(outcome.receipts_by_block(10)->size() == 1);
}

TEST_CASE("Backfill streams match plain jobs", "[backfill][stream_job]") {
    BackfillTest test{12, 2};

    for (const size_t parallelism : {1u, 3u, 16u}) {
        BackfillSettings settings{max_blocks_settings(5)};
        settings.stream_parallelism = parallelism;

        BackfillJob plain{test.factory(settings).backfill(1, 12)};
        auto stream{test.factory(settings).backfill(1, 12).into_stream()};
        const std::vector<chain::Chain> plain_batches{collect_batches(plain)};
        const std::vector<chain::Chain> stream_batches{collect_batches(stream)};
        REQUIRE(stream_batches.size() == 3);
        CHECK(stream_batches == plain_batches);

        auto single_stream{test.factory(settings).backfill(1, 12).into_single_blocks().into_stream()};
        BlockNum expected{1};
        while (auto output = single_stream.next()) {
            CHECK(output->first.number() == expected++);
        }
        CHECK(expected == 13);
    }
}

TEST_CASE("Backfill streams surface errors at the same block", "[backfill][stream_job]") {
    BackfillTest test{8};
    test.provider().remove_block(6);

    BackfillSettings settings{max_blocks_settings(2)};
    settings.stream_parallelism = 4;
    auto stream{test.factory(settings).backfill(1, 8).into_stream()};

    CHECK(stream.next()->range() == BlockRange{1, 2});
    CHECK(stream.next()->range() == BlockRange{3, 4});
    const BlockExecutionError error{capture_error([&] { stream.next(); })};
    CHECK(error.code() == ExecutionErrorCode::kBlockNotFound);
    CHECK(error.block_num() == 6);
    CHECK(stream.range() == BlockRange{5, 8});
}

TEST_CASE("BackfillJobFactory ranges", "[backfill][factory]") {
    BackfillTest test{4};
    const BackfillJobFactory factory{test.factory()};

    CHECK(factory.settings().sender_recovery == SenderRecoveryMode::kChecked);
    CHECK(factory.backfill_range(2).range() == BlockRange{2, 4});
    CHECK(factory.backfill_range(2, 3).range() == BlockRange{2, 3});
    CHECK(factory.backfill_range(9).range().empty());
    CHECK(factory.backfill(BlockRange{3, 2}).range().empty());
}

}  // namespace spindle::backfill
