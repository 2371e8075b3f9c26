// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace spindle {

//! \brief Measures elapsed time of an operation on the steady clock
class StopWatch {
  public:
    using TimePoint = std::chrono::time_point<std::chrono::steady_clock>;
    using Duration = std::chrono::nanoseconds;

    static constexpr bool kStart = true;

    explicit StopWatch(bool auto_start = false) {
        if (auto_start) start();
    }

    //! \return The TimePoint the watch has been started on, unchanged if already running
    TimePoint start() noexcept;

    //! \return Elapsed time since start, zero if never started
    Duration since_start() const noexcept;

    //! \return The stop TimePoint and the elapsed time since start
    std::pair<TimePoint, Duration> stop() noexcept;

    //! \brief Human readable duration, e.g. "1h 2m 3s", "2.040s" or "250us"
    static std::string format(Duration duration);

    explicit operator bool() const noexcept { return running_; }

  private:
    bool running_{false};
    TimePoint start_time_{};
};

}  // namespace spindle
