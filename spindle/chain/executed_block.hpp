// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <spindle/core/types/recovered_block.hpp>
#include <spindle/execution/execution_outcome.hpp>
#include <spindle/trie/hashed_post_state.hpp>
#include <spindle/trie/state_root.hpp>
#include <spindle/trie/trie_updates.hpp>

namespace spindle::chain {

//! \brief A block with everything its execution produced
//! \details Each part is immutable and shared independently, so consumers may keep only what they need
class ExecutedBlock {
  public:
    ExecutedBlock(std::shared_ptr<const RecoveredBlock> recovered_block,
                  std::shared_ptr<const execution::ExecutionOutcome> execution_outcome,
                  std::shared_ptr<const trie::HashedPostState> hashed_post_state,
                  std::shared_ptr<const trie::TrieUpdates> trie_updates);

    //! \brief Builds the record of a freshly executed block
    //! \param state_root_provider when present the post-state root is computed and checked against the header
    //! \throws execution::BlockExecutionError with kStateRootMismatch when the computed root differs
    static ExecutedBlock from_output(RecoveredBlock block, execution::BlockExecutionOutput output,
                                     const trie::StateRootProvider* state_root_provider = nullptr);

    const RecoveredBlock& recovered_block() const { return *recovered_block_; }
    const execution::ExecutionOutcome& execution_outcome() const { return *execution_outcome_; }
    const trie::HashedPostState& hashed_post_state() const { return *hashed_post_state_; }
    const trie::TrieUpdates& trie_updates() const { return *trie_updates_; }

    std::shared_ptr<const RecoveredBlock> recovered_block_ptr() const { return recovered_block_; }
    std::shared_ptr<const execution::ExecutionOutcome> execution_outcome_ptr() const { return execution_outcome_; }
    std::shared_ptr<const trie::HashedPostState> hashed_post_state_ptr() const { return hashed_post_state_; }
    std::shared_ptr<const trie::TrieUpdates> trie_updates_ptr() const { return trie_updates_; }

  private:
    std::shared_ptr<const RecoveredBlock> recovered_block_;
    std::shared_ptr<const execution::ExecutionOutcome> execution_outcome_;
    std::shared_ptr<const trie::HashedPostState> hashed_post_state_;
    std::shared_ptr<const trie::TrieUpdates> trie_updates_;
};

}  // namespace spindle::chain
