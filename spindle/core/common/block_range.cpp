// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_range.hpp"

#include <stdexcept>

namespace spindle {

BlockRange::BlockRange(BlockNum start, BlockNum end) : start_{start}, end_{end} {
    if (end_ == kMaxBlockNum) {
        throw std::invalid_argument{"block range end must be lower than " + std::to_string(kMaxBlockNum)};
    }
    if (start_ > end_ + 1) {
        throw std::invalid_argument{"invalid block range [" + std::to_string(start) + ", " + std::to_string(end) + "]"};
    }
}

void BlockRange::advance_to(BlockNum next_start) {
    if (next_start < start_ || next_start > end_ + 1) {
        throw std::invalid_argument{"cannot advance " + to_string() + " to " + std::to_string(next_start)};
    }
    start_ = next_start;
}

std::string BlockRange::to_string() const {
    return "[" + std::to_string(start_) + ", " + std::to_string(end_) + "]";
}

}  // namespace spindle
