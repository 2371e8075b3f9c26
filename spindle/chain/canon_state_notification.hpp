// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <variant>

#include <spindle/chain/chain.hpp>

namespace spindle::chain {

//! \brief Transition of the canonical chain: a Commit of new blocks or a Reorg replacing old blocks with new ones
//! \details Both sides hold non-null chains. Copies share the same immutable Chain objects.
class CanonStateNotification {
  public:
    struct Commit {
        std::shared_ptr<const Chain> new_chain;
    };
    struct Reorg {
        std::shared_ptr<const Chain> old_chain;
        std::shared_ptr<const Chain> new_chain;
    };

    //! \throws std::invalid_argument if new_chain is null
    static CanonStateNotification commit(std::shared_ptr<const Chain> new_chain);

    //! \throws std::invalid_argument if either chain is null
    static CanonStateNotification reorg(std::shared_ptr<const Chain> old_chain, std::shared_ptr<const Chain> new_chain);

    bool is_reorg() const { return std::holds_alternative<Reorg>(value_); }

    //! \brief Chain that became canonical
    const std::shared_ptr<const Chain>& committed() const;

    //! \brief Chain that was reverted, null for commits
    std::shared_ptr<const Chain> reverted() const;

    //! \brief Tip block of the new canonical chain
    const RecoveredBlock& tip() const { return committed()->tip(); }

    const std::variant<Commit, Reorg>& value() const { return value_; }

  private:
    explicit CanonStateNotification(std::variant<Commit, Reorg> value) : value_{std::move(value)} {}

    std::variant<Commit, Reorg> value_;
};

}  // namespace spindle::chain
