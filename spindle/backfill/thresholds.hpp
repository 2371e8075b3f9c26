// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace spindle::backfill {

//! \brief Limits closing a batch of executed blocks, each one disabled when unset
//! \details A batch is closed as soon as any limit is reached
struct ExecutionThresholds {
    std::optional<uint64_t> max_blocks{500'000};
    std::optional<uint64_t> max_changes{5'000'000};
    std::optional<uint64_t> max_cumulative_gas{30'000'000ull * 50'000};
    std::optional<std::chrono::steady_clock::duration> max_duration{std::chrono::minutes{10}};

    //! \param blocks number of blocks executed in the batch so far, at least one
    //! \param changes estimated number of state changes accumulated by the batch
    //! \param cumulative_gas gas used by the blocks of the batch
    //! \param elapsed time since the batch started
    bool is_end_of_batch(uint64_t blocks, uint64_t changes, uint64_t cumulative_gas,
                         std::chrono::steady_clock::duration elapsed) const;

    std::string to_string() const;

    friend bool operator==(const ExecutionThresholds&, const ExecutionThresholds&) = default;
};

}  // namespace spindle::backfill
