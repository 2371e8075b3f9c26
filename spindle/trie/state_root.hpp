// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <spindle/trie/hashed_post_state.hpp>
#include <spindle/trie/trie_updates.hpp>

namespace spindle::trie {

struct StateRootOutput {
    evmc::bytes32 root;
    TrieUpdates updates;
};

//! Computes the state root resulting from applying a hashed post state on top of the stored state
class StateRootProvider {
  public:
    virtual ~StateRootProvider() = default;

    virtual StateRootOutput state_root_with_updates(const HashedPostState& post_state) const = 0;
};

}  // namespace spindle::trie
