// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <spindle/trie/state_root.hpp>

namespace spindle::test_util {

//! Returns a fixed root and fixed trie updates, remembering the last post state it was given
class MockStateRootProvider : public trie::StateRootProvider {
  public:
    explicit MockStateRootProvider(const evmc::bytes32& root, trie::TrieUpdates updates = {})
        : root_{root}, updates_{std::move(updates)} {}

    trie::StateRootOutput state_root_with_updates(const trie::HashedPostState& post_state) const override {
        last_post_state_ = post_state;
        return {root_, updates_};
    }

    const std::optional<trie::HashedPostState>& last_post_state() const { return last_post_state_; }

  private:
    evmc::bytes32 root_;
    trie::TrieUpdates updates_;
    mutable std::optional<trie::HashedPostState> last_post_state_;
};

}  // namespace spindle::test_util
