// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <spindle/core/common/base.hpp>

namespace spindle {

//! Inclusive interval [start, end] of block numbers, empty once start == end + 1
class BlockRange {
  public:
    //! \throws std::invalid_argument if end is kMaxBlockNum or start > end + 1
    BlockRange(BlockNum start, BlockNum end);

    BlockNum start() const { return start_; }
    BlockNum end() const { return end_; }

    bool empty() const { return start_ > end_; }
    uint64_t size() const { return empty() ? 0 : end_ - start_ + 1; }
    bool contains(BlockNum block_num) const { return start_ <= block_num && block_num <= end_; }

    //! Moves the start forward to next_start, at most up to end + 1
    void advance_to(BlockNum next_start);

    std::string to_string() const;

    friend bool operator==(const BlockRange&, const BlockRange&) = default;

  private:
    BlockNum start_;
    BlockNum end_;
};

}  // namespace spindle
