// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <spindle/infra/test_util/log.hpp>

namespace spindle::log {

//! LogBuffer exposing the buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

template <Level level>
void check_log_empty() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "test";
    CHECK(log_buffer.content().empty());
}

template <Level level>
void check_log_not_empty() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "test";
    CHECK(absl::StrContains(log_buffer.content(), "test"));
}

static std::string prettified_key_value(const std::string& key, const std::string& value) {
    std::string kv_pair{kColorGreen};
    kv_pair.append(key);
    kv_pair.append(kColorReset);
    kv_pair.append("=");
    kv_pair.append(kColorReset);
    kv_pair.append(kColorWhite);
    kv_pair.append(value);
    return kv_pair;
}

TEST_CASE("LogBuffer", "[infra][common][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    // Keep the terminal clean
    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    init(Settings{.log_verbosity = Level::kInfo});

    SECTION("nothing stored above configured verbosity") {
        check_log_empty<Level::kDebug>();
        check_log_empty<Level::kTrace>();
        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        check_log_empty<Level::kInfo>();
    }

    SECTION("content stored up to configured verbosity") {
        check_log_not_empty<Level::kInfo>();
        check_log_not_empty<Level::kWarning>();
        check_log_not_empty<Level::kError>();
        check_log_not_empty<Level::kCritical>();
        check_log_not_empty<Level::kNone>();
    }

    SECTION("thread name") {
        set_thread_name("backfill");
        init(Settings{.log_threads = true, .log_verbosity = Level::kInfo});
        auto log_buffer = LogBufferForTest<Level::kInfo>();
        log_buffer << "test";
        CHECK(absl::StrContains(log_buffer.content(), "[backfill   ]"));
        init(Settings{.log_verbosity = Level::kInfo});
    }

    SECTION("key-value arguments") {
        auto log_buffer = LogBufferForTest<Level::kInfo>("Executed batch", {"from", "1", "to", "10"});
        CHECK(absl::StrContains(log_buffer.content(), "Executed batch"));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("from", "1")));
        CHECK(absl::StrContains(log_buffer.content(), prettified_key_value("to", "10")));
    }

    SECTION("flush goes to stderr without colors on non-terminal") {
        if (!is_terminal_stderr()) {
            { LogBufferForTest<Level::kInfo>{"flushed", {"key", "value"}}; }
            CHECK(absl::StrContains(string_cerr.str(), "flushed"));
            CHECK(absl::StrContains(string_cerr.str(), "key=value"));
        }
    }
}

TEST_CASE("SPINDLE_LOGBUFFER skips disabled levels", "[infra][common][log]") {
    test_util::SetLogVerbosityGuard guard{Level::kInfo};
    int evaluated{0};
    auto side_effect = [&]() { return ++evaluated; };
    SPINDLE_DEBUG << side_effect();
    CHECK(evaluated == 0);
    CHECK(test_verbosity(Level::kInfo));
    CHECK_FALSE(test_verbosity(Level::kDebug));
}

}  // namespace spindle::log
