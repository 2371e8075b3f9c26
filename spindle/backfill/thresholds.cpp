// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "thresholds.hpp"

#include <absl/strings/str_format.h>

#include <spindle/infra/common/stopwatch.hpp>

namespace spindle::backfill {

bool ExecutionThresholds::is_end_of_batch(uint64_t blocks, uint64_t changes, uint64_t cumulative_gas,
                                          std::chrono::steady_clock::duration elapsed) const {
    return (max_blocks && blocks >= *max_blocks) ||
           (max_changes && changes >= *max_changes) ||
           (max_cumulative_gas && cumulative_gas >= *max_cumulative_gas) ||
           (max_duration && elapsed >= *max_duration);
}

std::string ExecutionThresholds::to_string() const {
    const auto limit = [](const std::optional<uint64_t>& value) {
        return value ? std::to_string(*value) : std::string{"none"};
    };
    return absl::StrFormat("blocks=%s changes=%s gas=%s duration=%s", limit(max_blocks), limit(max_changes),
                           limit(max_cumulative_gas),
                           max_duration ? StopWatch::format(*max_duration) : std::string{"none"});
}

}  // namespace spindle::backfill
