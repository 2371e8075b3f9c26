// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "canonical_state_hub.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>

#include <spindle/infra/test_util/log.hpp>
#include <spindle/infra/test_util/task_runner.hpp>
#include <spindle/test_util/in_memory_provider.hpp>
#include <spindle/test_util/test_block_builder.hpp>

namespace spindle::chain {

namespace {

    std::shared_ptr<const Chain> make_chain(BlockNum tip) {
        test_util::InMemoryChainProvider provider;
        test_util::TestBlockBuilder builder;
        std::vector<SealedBlock> sealed{builder.populate(provider, tip, /*txs_per_block=*/0)};
        std::vector<RecoveredBlock> blocks;
        blocks.emplace_back(std::move(sealed.back()), std::vector<evmc::address>{});
        return std::make_shared<const Chain>(std::move(blocks),
                                             execution::ExecutionOutcome{{}, std::vector<Receipts>(1), tip});
    }

    std::vector<BlockNum> drain(CanonStateNotificationStream& stream) {
        std::vector<BlockNum> tips;
        while (std::optional<CanonStateNotification> notification = stream.try_receive()) {
            tips.push_back(notification->tip().number());
        }
        return tips;
    }

}  // namespace

TEST_CASE("CanonicalStateHub delivers commits to current subscribers", "[chain][canonical_state_hub]") {
    test_util::TaskRunner runner;
    CanonicalStateHub hub{runner.executor()};
    const auto chain{make_chain(1)};

    CanonStateNotificationStream first{hub.subscribe()};
    CanonStateNotificationStream second{hub.subscribe()};
    CHECK(hub.subscriber_count() == 2);

    hub.publish_commit(chain);

    const CanonStateNotification received{runner.run(first.receive())};
    CHECK(received.committed().get() == chain.get());
    const std::optional<CanonStateNotification> other{second.try_receive()};
    REQUIRE(other);
    CHECK(other->committed().get() == chain.get());
}

TEST_CASE("CanonicalStateHub does not replay past notifications", "[chain][canonical_state_hub]") {
    test_util::TaskRunner runner;
    CanonicalStateHub hub{runner.executor()};
    const auto chain_a{make_chain(1)};
    const auto chain_b{make_chain(2)};

    CanonStateNotificationStream s1{hub.subscribe()};
    hub.publish_commit(chain_a);
    CanonStateNotificationStream s2{hub.subscribe()};
    hub.publish_commit(chain_b);

    CHECK(drain(s1) == std::vector<BlockNum>{1, 2});
    CHECK(drain(s2) == std::vector<BlockNum>{2});
}

TEST_CASE("CanonicalStateHub drops departed subscribers on publish", "[chain][canonical_state_hub]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    CanonicalStateHub hub{runner.executor()};
    const auto chain{make_chain(1)};

    CanonStateNotificationStream kept{hub.subscribe()};
    {
        CanonStateNotificationStream dropped{hub.subscribe()};
    }
    CHECK(hub.subscriber_count() == 2);

    hub.publish_commit(chain);
    CHECK(hub.subscriber_count() == 1);
    CHECK(drain(kept) == std::vector<BlockNum>{1});
}

TEST_CASE("CanonicalStateHub drops subscribers with a full buffer", "[chain][canonical_state_hub]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    CanonicalStateHub hub{runner.executor(), /*channel_capacity=*/2};
    const auto chain{make_chain(1)};

    CanonStateNotificationStream slow{hub.subscribe()};
    CanonStateNotificationStream fast{hub.subscribe()};

    hub.publish_commit(chain);
    CHECK(drain(fast).size() == 1);
    hub.publish_commit(chain);
    CHECK(drain(fast).size() == 1);
    CHECK(hub.subscriber_count() == 2);

    hub.publish_commit(chain);
    CHECK(hub.subscriber_count() == 1);
    CHECK(drain(fast).size() == 1);

    // Buffered notifications are still readable, then the closed subscription reports an error
    CHECK(slow.try_receive());
    CHECK(slow.try_receive());
    CHECK_THROWS_AS(slow.try_receive(), boost::system::system_error);
}

TEST_CASE("CanonicalStateHub delivers reorgs", "[chain][canonical_state_hub]") {
    test_util::TaskRunner runner;
    CanonicalStateHub hub{runner.executor()};
    const auto old_chain{make_chain(3)};
    const auto new_chain{make_chain(4)};

    CanonStateNotificationStream stream{hub.subscribe()};
    hub.publish_reorg(old_chain, new_chain);

    const std::optional<CanonStateNotification> received{stream.try_receive()};
    REQUIRE(received);
    CHECK(received->is_reorg());
    CHECK(received->reverted().get() == old_chain.get());
    CHECK(received->committed().get() == new_chain.get());
    CHECK_THROWS_AS(hub.publish_reorg(old_chain, nullptr), std::invalid_argument);
}

TEST_CASE("CanonStateNotificationStream move assignment closes the previous channel", "[chain][canonical_state_hub]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    CanonicalStateHub hub{runner.executor()};

    CanonStateNotificationStream stream{hub.subscribe()};
    stream = hub.subscribe();
    hub.publish_commit(make_chain(1));
    CHECK(hub.subscriber_count() == 1);
    CHECK(drain(stream) == std::vector<BlockNum>{1});
}

}  // namespace spindle::chain
