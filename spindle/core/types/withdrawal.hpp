// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <evmc/evmc.hpp>

namespace spindle {

// EIP-4895: Beacon chain push withdrawals as operations
struct Withdrawal {
    uint64_t index{0};
    uint64_t validator_index{0};
    evmc::address address{};
    uint64_t amount{0};  // in GWei

    friend bool operator==(const Withdrawal&, const Withdrawal&) = default;
};

}  // namespace spindle
