// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <intx/intx.hpp>

#include <spindle/core/common/bytes.hpp>

namespace spindle::endian {

// NOLINTNEXTLINE(readability-identifier-naming)
const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;

//! \brief Transforms a uint64_t to its compacted big endian byte form
//! \return A ByteView into an internal thread local buffer, overwritten by the next call on the same thread
//! \remarks A "compact" big endian form strips leftmost bytes valued to zero
ByteView to_big_compact(uint64_t value);

//! \brief Transforms a uint256 to its compacted big endian byte form
//! \return A ByteView into an internal thread local buffer, overwritten by the next call on the same thread
ByteView to_big_compact(const intx::uint256& value);

}  // namespace spindle::endian
