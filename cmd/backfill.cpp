// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <magic_enum.hpp>

#include <spindle/backfill/factory.hpp>
#include <spindle/backfill/stream_job.hpp>
#include <spindle/chain/canonical_state_hub.hpp>
#include <spindle/chain/executed_block.hpp>
#include <spindle/core/common/util.hpp>
#include <spindle/execution/execution_error.hpp>
#include <spindle/infra/cli/common.hpp>
#include <spindle/infra/common/log.hpp>
#include <spindle/infra/common/stopwatch.hpp>
#include <spindle/test_util/in_memory_provider.hpp>
#include <spindle/test_util/test_block_builder.hpp>
#include <spindle/test_util/transfer_executor.hpp>

using namespace spindle;
using namespace spindle::cmd::common;

struct BackfillToolSettings {
    log::Settings log_settings;
    backfill::BackfillSettings backfill_settings;
    uint64_t num_blocks{100};
    uint64_t txs_per_block{10};
    bool single_blocks{false};
};

void parse_command_line(int argc, char* argv[], CLI::App& app, BackfillToolSettings& settings) {
    auto& thresholds = settings.backfill_settings.thresholds;

    app.add_option("--blocks", settings.num_blocks, "Number of synthetic blocks to build and backfill")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{1}, uint64_t{1'000'000}));
    app.add_option("--txs-per-block", settings.txs_per_block, "Number of signed transfers in each block")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{0}, uint64_t{10'000}));

    auto& batch_opts = *app.add_option_group("Batch", "Batch thresholds, each one unlimited when set to 0");
    uint64_t max_blocks{*thresholds.max_blocks};
    uint64_t max_changes{*thresholds.max_changes};
    uint64_t max_gas{*thresholds.max_cumulative_gas};
    uint64_t max_duration_seconds{
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(*thresholds.max_duration).count())};
    batch_opts.add_option("--batch.max-blocks", max_blocks, "Maximum number of blocks in one batch")
        ->capture_default_str();
    batch_opts.add_option("--batch.max-changes", max_changes, "Maximum number of state changes in one batch")
        ->capture_default_str();
    batch_opts.add_option("--batch.max-gas", max_gas, "Maximum cumulative gas in one batch")
        ->capture_default_str();
    batch_opts.add_option("--batch.max-duration", max_duration_seconds, "Maximum execution time of one batch in seconds")
        ->capture_default_str();

    app.add_option("--stream.parallelism", settings.backfill_settings.stream_parallelism,
                   "Number of blocks fetched ahead of execution, 0 disables prefetching")
        ->capture_default_str();
    app.add_flag("--single-blocks", settings.single_blocks, "Execute and publish one block at a time");

    bool unchecked_senders{false};
    app.add_flag("--senders.unchecked", unchecked_senders, "Recover senders without enforcing the low-s rule");

    std::string prune_mode{"disabled"};
    db::PruneDistance receipts_older;
    db::PruneThreshold receipts_before;
    auto& prune_opts = *app.add_option_group("Prune", "Prune options");
    prune_opts.add_option("--prune", prune_mode, "Data to be pruned: r = receipts")
        ->capture_default_str();
    prune_opts.add_option("--prune.r.older", receipts_older, "Prune receipts older than this many blocks from the tip");
    prune_opts.add_option("--prune.r.before", receipts_before, "Prune receipts of blocks before this number");

    add_logging_options(app, settings.log_settings);

    app.parse(argc, argv);

    auto optional_limit = [](uint64_t value) { return value ? std::optional<uint64_t>{value} : std::nullopt; };
    thresholds.max_blocks = optional_limit(max_blocks);
    thresholds.max_changes = optional_limit(max_changes);
    thresholds.max_cumulative_gas = optional_limit(max_gas);
    thresholds.max_duration = max_duration_seconds
                                  ? std::optional<std::chrono::steady_clock::duration>{std::chrono::seconds{max_duration_seconds}}
                                  : std::nullopt;

    settings.backfill_settings.sender_recovery =
        unchecked_senders ? SenderRecoveryMode::kUnchecked : SenderRecoveryMode::kChecked;
    settings.backfill_settings.prune_mode = db::parse_prune_mode(prune_mode, receipts_older, receipts_before);
}

//! Logs every notification buffered for the subscriber
static void drain(chain::CanonStateNotificationStream& subscriber) {
    while (auto notification = subscriber.try_receive()) {
        const auto& committed = *notification->committed();
        SPINDLE_INFO_M("Subscriber", {"kind", notification->is_reorg() ? "reorg" : "commit",
                                      "range", committed.range().to_string(),
                                      "blocks", std::to_string(committed.size()),
                                      "tip", to_hex(notification->tip().hash(), /*with_prefix=*/true)});
    }
}

template <class Job, class Publish>
static size_t run_job(Job& job, Publish&& publish) {
    size_t published{0};
    while (auto item = job.next()) {
        publish(std::move(*item));
        ++published;
    }
    return published;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Backfill a synthetic chain and publish its batches to a canonical state subscriber"};

    try {
        BackfillToolSettings settings;
        parse_command_line(argc, argv, app, settings);

        log::init(settings.log_settings);
        const auto& backfill_settings = settings.backfill_settings;
        SPINDLE_INFO_M("Backfill tool", {"blocks", std::to_string(settings.num_blocks),
                                         "txs_per_block", std::to_string(settings.txs_per_block),
                                         "thresholds", backfill_settings.thresholds.to_string(),
                                         "prune", backfill_settings.prune_mode.to_string(),
                                         "parallelism", std::to_string(backfill_settings.stream_parallelism),
                                         "senders", std::string{magic_enum::enum_name(backfill_settings.sender_recovery)}});

        auto provider = std::make_shared<test_util::InMemoryChainProvider>();
        test_util::TestBlockBuilder builder;
        builder.populate(*provider, settings.num_blocks, settings.txs_per_block);

        backfill::BackfillJobFactory factory{std::make_shared<test_util::TransferExecutorProvider>(), provider,
                                             backfill_settings};

        boost::asio::io_context ioc;
        chain::CanonicalStateHub hub{ioc.get_executor()};
        auto subscriber = hub.subscribe();

        StopWatch sw{/*auto_start=*/true};
        auto publish_chain = [&](chain::Chain batch) {
            hub.publish_commit(std::make_shared<const chain::Chain>(std::move(batch)));
            drain(subscriber);
        };
        auto publish_block = [&](backfill::ExecutedBlockOutput output) {
            auto executed = chain::ExecutedBlock::from_output(std::move(output.first), std::move(output.second));
            publish_chain(chain::Chain::from_executed_blocks({std::move(executed)}));
        };

        auto job = factory.backfill_range(1);
        const bool stream{backfill_settings.stream_parallelism > 0};
        size_t published{0};
        if (settings.single_blocks) {
            auto single = std::move(job).into_single_blocks();
            if (stream) {
                auto streamed = std::move(single).into_stream();
                published = run_job(streamed, publish_block);
            } else {
                published = run_job(single, publish_block);
            }
        } else if (stream) {
            auto streamed = std::move(job).into_stream();
            published = run_job(streamed, publish_chain);
        } else {
            published = run_job(job, publish_chain);
        }

        const auto [_, duration] = sw.stop();
        SPINDLE_INFO_M("Backfill completed", {"notifications", std::to_string(published),
                                              "signer_nonce", std::to_string(builder.signer_account().nonce),
                                              "elapsed", StopWatch::format(duration)});
        return 0;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const execution::BlockExecutionError& e) {
        SPINDLE_CRIT_M("Backfill failed", {"code", std::string{magic_enum::enum_name(e.code())},
                                           "block", std::to_string(e.block_num()),
                                           "cause", e.cause()});
        return -1;
    } catch (const std::exception& e) {
        SPINDLE_CRIT_M("Unexpected error", {"what", e.what()});
        return -2;
    }
}
