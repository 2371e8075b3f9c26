// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <string_view>
#include <vector>

#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace spindle {

using namespace std::chrono_literals;

StopWatch::TimePoint StopWatch::start() noexcept {
    if (!running_) {
        running_ = true;
        start_time_ = std::chrono::steady_clock::now();
    }
    return start_time_;
}

StopWatch::Duration StopWatch::since_start() const noexcept {
    if (start_time_ == TimePoint{}) return Duration{0};
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time_);
}

std::pair<StopWatch::TimePoint, StopWatch::Duration> StopWatch::stop() noexcept {
    if (!running_) return {};
    running_ = false;
    const TimePoint now{std::chrono::steady_clock::now()};
    return {now, std::chrono::duration_cast<Duration>(now - start_time_)};
}

//! Whole units plus the next smaller unit as a three digit fraction, e.g. 2.040s
template <class Unit, class SubUnit>
static std::string with_fraction(StopWatch::Duration duration, std::string_view suffix) {
    const auto whole{std::chrono::duration_cast<Unit>(duration)};
    const auto fraction{std::chrono::duration_cast<SubUnit>(duration - whole)};
    if (fraction.count() == 0) {
        return absl::StrFormat("%d%s", whole.count(), suffix);
    }
    return absl::StrFormat("%d.%03d%s", whole.count(), fraction.count(), suffix);
}

std::string StopWatch::format(Duration duration) {
    using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

    if (duration < 1ms) {
        return absl::StrFormat("%dus", std::chrono::duration_cast<std::chrono::microseconds>(duration).count());
    }
    if (duration < 1s) {
        return with_fraction<std::chrono::milliseconds, std::chrono::microseconds>(duration, "ms");
    }
    if (duration < 60s) {
        return with_fraction<std::chrono::seconds, std::chrono::milliseconds>(duration, "s");
    }

    std::vector<std::string> parts;
    auto take = [&]<class Unit>(Unit, std::string_view suffix) {
        const auto amount{std::chrono::duration_cast<Unit>(duration)};
        duration -= amount;
        if (amount.count()) parts.push_back(absl::StrFormat("%d%s", amount.count(), suffix));
    };
    take(Days{}, "d");
    take(std::chrono::hours{}, "h");
    take(std::chrono::minutes{}, "m");
    take(std::chrono::seconds{}, "s");
    return absl::StrJoin(parts, " ");
}

}  // namespace spindle
