// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <thread>

#include <catch2/catch_test_macros.hpp>

namespace spindle {

using namespace std::chrono_literals;

TEST_CASE("StopWatch elapsed time", "[infra][common][stopwatch]") {
    StopWatch sw;
    CHECK_FALSE(sw);
    CHECK(sw.since_start() == StopWatch::Duration{0});
    CHECK(sw.stop().second == StopWatch::Duration{0});

    const auto started{sw.start()};
    CHECK(sw);
    CHECK(sw.start() == started);
    std::this_thread::sleep_for(2ms);
    CHECK(sw.since_start() >= 2ms);

    const auto [stopped, elapsed] = sw.stop();
    CHECK_FALSE(sw);
    CHECK(elapsed >= 2ms);
    CHECK(stopped - started == elapsed);
}

TEST_CASE("StopWatch format", "[infra][common][stopwatch]") {
    CHECK(StopWatch::format(250us) == "250us");
    CHECK(StopWatch::format(3ms + 5us) == "3.005ms");
    CHECK(StopWatch::format(2s + 40ms) == "2.040s");
    CHECK(StopWatch::format(2s) == "2s");
    CHECK(StopWatch::format(1h + 2min + 3s) == "1h 2m 3s");
    CHECK(StopWatch::format(std::chrono::hours{25}) == "1d 1h");
}

}  // namespace spindle
