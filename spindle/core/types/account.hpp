// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

namespace spindle {

using namespace evmc::literals;

// keccak256 of the empty string
inline constexpr evmc::bytes32 kEmptyHash{0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};

    bool is_empty() const { return nonce == 0 && balance == 0 && code_hash == kEmptyHash; }

    friend bool operator==(const Account&, const Account&) = default;
};

}  // namespace spindle
