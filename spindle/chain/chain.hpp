// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <absl/container/btree_map.h>
#include <evmc/evmc.hpp>

#include <spindle/core/common/base.hpp>
#include <spindle/core/common/block_range.hpp>
#include <spindle/core/types/receipt.hpp>
#include <spindle/core/types/recovered_block.hpp>
#include <spindle/db/provider.hpp>
#include <spindle/execution/execution_outcome.hpp>
#include <spindle/trie/trie_updates.hpp>

namespace spindle::chain {

class ExecutedBlock;

//! \brief Contiguous non-empty sequence of executed blocks with their aggregated execution outcome
//! \details Block numbers increase by one, the outcome starts at the first block and has one receipt list per block.
//! Violations are rejected with std::logic_error at construction and on append.
class Chain {
  public:
    Chain(std::vector<RecoveredBlock> blocks, execution::ExecutionOutcome outcome,
          std::optional<trie::TrieUpdates> trie_updates = std::nullopt);

    //! \throws std::logic_error if executed_blocks is empty or not contiguous
    static Chain from_executed_blocks(const std::vector<ExecutedBlock>& executed_blocks);

    const absl::btree_map<BlockNum, RecoveredBlock>& blocks() const { return blocks_; }
    const execution::ExecutionOutcome& execution_outcome() const { return outcome_; }
    const std::optional<trie::TrieUpdates>& trie_updates() const { return trie_updates_; }

    const RecoveredBlock& first() const { return blocks_.begin()->second; }
    const RecoveredBlock& tip() const { return blocks_.rbegin()->second; }
    size_t size() const { return blocks_.size(); }
    BlockRange range() const { return BlockRange{first().number(), tip().number()}; }

    //! \brief Block the chain was forked from, i.e. the parent of the first block
    db::BlockId fork_block() const;

    const RecoveredBlock* block_by_hash(const evmc::bytes32& hash) const;

    //! \brief Blocks paired with their receipts, in ascending order
    std::vector<std::pair<const RecoveredBlock*, const Receipts*>> blocks_and_receipts() const;

    //! \brief Appends the next block and the outcome of executing it
    //! \throws std::logic_error if the block does not follow the tip or the outcome does not start at it
    void append_block(RecoveredBlock block, execution::ExecutionOutcome outcome);

    friend bool operator==(const Chain&, const Chain&) = default;

  private:
    void check_invariants() const;

    absl::btree_map<BlockNum, RecoveredBlock> blocks_;
    execution::ExecutionOutcome outcome_;
    std::optional<trie::TrieUpdates> trie_updates_;
};

}  // namespace spindle::chain
