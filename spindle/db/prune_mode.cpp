// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "prune_mode.hpp"

#include <stdexcept>

#include <absl/strings/match.h>

namespace spindle::db {

void BlockAmount::to_string(std::string& short_form, std::string& long_form, char prefix) const {
    if (!enabled()) return;
    if (type() == BlockAmount::Type::kOlder) {
        if (value() == kFullImmutabilityThreshold) {
            short_form += prefix;
        } else {
            long_form += " --prune.";
            long_form += prefix;
            long_form += (".older=" + std::to_string(value()));
        }
    } else {
        long_form += " --prune.";
        long_form += prefix;
        long_form += (".before=" + std::to_string(value()));
    }
}

BlockNum BlockAmount::value() const {
    if (!enabled()) {
        return 0;
    }
    switch (type_) {
        case Type::kOlder:
            return value_.has_value() ? *value_ : kFullImmutabilityThreshold;
        case Type::kBefore:
            return value_.has_value() ? *value_ : 0;
    }
    throw std::runtime_error("Invalid prune type");
}

BlockNum BlockAmount::value_from_head(BlockNum head) const {
    if (!enabled_) {
        return 0;
    }

    const BlockNum prune_value{value()};
    switch (type_) {
        case Type::kOlder:
            if (prune_value >= head) return 0;
            return head - prune_value;
        case Type::kBefore:
            return prune_value;
    }
    return 0;
}

bool BlockAmount::should_prune(BlockNum block_num, BlockNum head) const {
    return enabled_ && block_num < value_from_head(head);
}

std::string PruneMode::to_string() const {
    std::string short_form{"--prune="};
    std::string long_form{};

    receipts_.to_string(short_form, long_form, 'r');

    return short_form + long_form;
}

PruneMode parse_prune_mode(const std::string& mode, const PruneDistance& older_receipts,
                           const PruneThreshold& before_receipts) {
    std::optional<BlockAmount> receipts;

    if (!mode.empty() && !(absl::EqualsIgnoreCase(mode, "default") || absl::EqualsIgnoreCase(mode, "disabled"))) {
        for (const auto& c : mode) {
            switch (c) {
                case 'r':
                    receipts = BlockAmount(BlockAmount::Type::kOlder, kFullImmutabilityThreshold);
                    break;
                default:
                    throw std::invalid_argument("Invalid prune mode: " + mode);
            }
        }
    }

    // Discrete values override the short form, 'before' wins over 'older'
    if (older_receipts) receipts = BlockAmount(BlockAmount::Type::kOlder, *older_receipts);
    if (before_receipts) receipts = BlockAmount(BlockAmount::Type::kBefore, *before_receipts);

    return PruneMode{receipts.value_or(BlockAmount{})};
}

}  // namespace spindle::db
