// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "canon_state_notification.hpp"

#include <utility>

#include <spindle/infra/common/ensure.hpp>

namespace spindle::chain {

CanonStateNotification CanonStateNotification::commit(std::shared_ptr<const Chain> new_chain) {
    ensure_pre_condition(new_chain != nullptr, [] { return "commit notification requires a new chain"; });
    return CanonStateNotification{Commit{std::move(new_chain)}};
}

CanonStateNotification CanonStateNotification::reorg(std::shared_ptr<const Chain> old_chain,
                                                     std::shared_ptr<const Chain> new_chain) {
    ensure_pre_condition(old_chain != nullptr, [] { return "reorg notification requires an old chain"; });
    ensure_pre_condition(new_chain != nullptr, [] { return "reorg notification requires a new chain"; });
    return CanonStateNotification{Reorg{std::move(old_chain), std::move(new_chain)}};
}

const std::shared_ptr<const Chain>& CanonStateNotification::committed() const {
    if (const auto* reorg = std::get_if<Reorg>(&value_)) {
        return reorg->new_chain;
    }
    return std::get<Commit>(value_).new_chain;
}

std::shared_ptr<const Chain> CanonStateNotification::reverted() const {
    if (const auto* reorg = std::get_if<Reorg>(&value_)) {
        return reorg->old_chain;
    }
    return nullptr;
}

}  // namespace spindle::chain
