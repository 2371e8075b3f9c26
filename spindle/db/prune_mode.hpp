// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <spindle/core/common/base.hpp>

namespace spindle::db {

inline constexpr BlockNum kFullImmutabilityThreshold{90'000};

using PruneDistance = std::optional<BlockNum>;   // for 'older' type
using PruneThreshold = std::optional<BlockNum>;  // for 'before' type

class BlockAmount {
  public:
    enum class Type : uint8_t {
        kOlder,  // Prune data older than (moving window)
        kBefore  // Prune data before (fixed)
    };

    BlockAmount() = default;

    explicit BlockAmount(Type type, BlockNum value) : value_{value}, enabled_{true}, type_{type} {}

    bool enabled() const { return enabled_; }
    Type type() const { return type_; };
    BlockNum value() const;

    //! \brief First block number which must be kept given the chain head
    BlockNum value_from_head(BlockNum head) const;

    //! \brief Whether data of block_num can be dropped when the chain will reach head
    bool should_prune(BlockNum block_num, BlockNum head) const;

    void to_string(std::string& short_form, std::string& long_form, char prefix) const;

    friend bool operator==(const BlockAmount&, const BlockAmount&) = default;

  private:
    std::optional<BlockNum> value_;
    bool enabled_{false};
    Type type_{Type::kOlder};
};

class PruneMode {
  public:
    PruneMode() = default;

    explicit PruneMode(BlockAmount receipts) : receipts_{receipts} {}

    const BlockAmount& receipts() const { return receipts_; }

    std::string to_string() const;

    friend bool operator==(const PruneMode&, const PruneMode&) = default;

  private:
    BlockAmount receipts_;  // Holds the pruning threshold for receipts
};

//! \brief Parses prune mode from a string
//! \param [in] mode : the string representation of PruneMode, e.g. "r" or "disabled"
//! \throws std::invalid_argument on unknown mode letters
PruneMode parse_prune_mode(const std::string& mode, const PruneDistance& older_receipts,
                           const PruneThreshold& before_receipts);

}  // namespace spindle::db
