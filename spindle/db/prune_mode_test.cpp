// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "prune_mode.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace spindle::db {

TEST_CASE("Parse prune mode", "[db][prune_mode]") {
    SECTION("disabled") {
        for (const std::string mode : {"", "default", "DISABLED"}) {
            const PruneMode prune_mode{parse_prune_mode(mode, std::nullopt, std::nullopt)};
            CHECK_FALSE(prune_mode.receipts().enabled());
            CHECK(prune_mode.to_string() == "--prune=");
        }
    }

    SECTION("short form") {
        const PruneMode prune_mode{parse_prune_mode("r", std::nullopt, std::nullopt)};
        CHECK(prune_mode.receipts().enabled());
        CHECK(prune_mode.receipts().type() == BlockAmount::Type::kOlder);
        CHECK(prune_mode.receipts().value() == kFullImmutabilityThreshold);
        CHECK(prune_mode.to_string() == "--prune=r");
    }

    SECTION("discrete values") {
        PruneMode prune_mode{parse_prune_mode("", 1'000, std::nullopt)};
        CHECK(prune_mode.receipts().value() == 1'000);
        CHECK(prune_mode.to_string() == "--prune= --prune.r.older=1000");

        prune_mode = parse_prune_mode("r", 1'000, 5'000);
        CHECK(prune_mode.receipts().type() == BlockAmount::Type::kBefore);
        CHECK(prune_mode.to_string() == "--prune= --prune.r.before=5000");
    }

    SECTION("invalid") {
        CHECK_THROWS_AS(parse_prune_mode("rx", std::nullopt, std::nullopt), std::invalid_argument);
    }
}

TEST_CASE("BlockAmount should_prune", "[db][prune_mode]") {
    SECTION("disabled") {
        const BlockAmount amount;
        CHECK_FALSE(amount.should_prune(0, 1'000'000));
    }

    SECTION("older") {
        const BlockAmount amount{BlockAmount::Type::kOlder, 10};
        CHECK(amount.value_from_head(100) == 90);
        CHECK(amount.should_prune(89, 100));
        CHECK_FALSE(amount.should_prune(90, 100));
        CHECK_FALSE(amount.should_prune(0, 10));
    }

    SECTION("before") {
        const BlockAmount amount{BlockAmount::Type::kBefore, 50};
        CHECK(amount.should_prune(49, 100));
        CHECK_FALSE(amount.should_prune(50, 100));
        CHECK(amount.should_prune(0, 0));
    }
}

}  // namespace spindle::db
