// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"
// and EIP-2: Homestead Hard-fork Changes.

#include <intx/intx.hpp>

namespace spindle {

inline constexpr intx::uint256 kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};

inline constexpr intx::uint256 kSecp256k1Halfn{kSecp256k1n >> 1};

//! Verifies whether the signature values are in range
//! \param [in] r : signature's r
//! \param [in] s : signature's s
//! \param [in] low_s : whether s must lie in the lower half of the curve order (EIP-2)
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s, bool low_s) noexcept;

}  // namespace spindle
