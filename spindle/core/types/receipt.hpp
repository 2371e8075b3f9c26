// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <spindle/core/types/transaction.hpp>

namespace spindle {

struct Receipt {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    uint64_t cumulative_gas_used{0};

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

using Receipts = std::vector<Receipt>;

}  // namespace spindle
