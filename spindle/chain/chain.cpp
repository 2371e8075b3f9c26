// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain.hpp"

#include <string>

#include <spindle/chain/executed_block.hpp>
#include <spindle/infra/common/ensure.hpp>

namespace spindle::chain {

Chain::Chain(std::vector<RecoveredBlock> blocks, execution::ExecutionOutcome outcome,
             std::optional<trie::TrieUpdates> trie_updates)
    : outcome_{std::move(outcome)}, trie_updates_{std::move(trie_updates)} {
    ensure_invariant(!blocks.empty(), "chain must contain at least one block");
    std::optional<BlockNum> previous;
    for (auto& block : blocks) {
        const BlockNum block_num{block.number()};
        ensure_invariant(!previous || block_num == *previous + 1, [&]() {
            return "chain blocks not contiguous: " + std::to_string(*previous) + " followed by " + std::to_string(block_num);
        });
        previous = block_num;
        blocks_.emplace(block_num, std::move(block));
    }
    check_invariants();
}

Chain Chain::from_executed_blocks(const std::vector<ExecutedBlock>& executed_blocks) {
    ensure_invariant(!executed_blocks.empty(), "chain must contain at least one block");

    std::vector<RecoveredBlock> blocks;
    blocks.reserve(executed_blocks.size());
    execution::ExecutionOutcome outcome;
    trie::TrieUpdates trie_updates;
    for (const ExecutedBlock& executed : executed_blocks) {
        blocks.push_back(executed.recovered_block());
        outcome.extend(executed.execution_outcome());
        trie_updates.extend(executed.trie_updates());
    }
    return Chain{std::move(blocks), std::move(outcome), std::move(trie_updates)};
}

void Chain::check_invariants() const {
    ensure_invariant(outcome_.first_block() == first().number(), [&]() {
        return "execution outcome starts at " + std::to_string(outcome_.first_block()) +
               " but chain starts at " + std::to_string(first().number());
    });
    ensure_invariant(outcome_.len() == blocks_.size(), [&]() {
        return "execution outcome has " + std::to_string(outcome_.len()) + " receipt lists for " +
               std::to_string(blocks_.size()) + " blocks";
    });
}

db::BlockId Chain::fork_block() const {
    const RecoveredBlock& first_block{first()};
    return {first_block.number() == 0 ? 0 : first_block.number() - 1, first_block.header().parent_hash};
}

const RecoveredBlock* Chain::block_by_hash(const evmc::bytes32& hash) const {
    for (const auto& [_, block] : blocks_) {
        if (block.hash() == hash) {
            return &block;
        }
    }
    return nullptr;
}

std::vector<std::pair<const RecoveredBlock*, const Receipts*>> Chain::blocks_and_receipts() const {
    std::vector<std::pair<const RecoveredBlock*, const Receipts*>> pairs;
    pairs.reserve(blocks_.size());
    for (const auto& [block_num, block] : blocks_) {
        pairs.emplace_back(&block, outcome_.receipts_by_block(block_num));
    }
    return pairs;
}

void Chain::append_block(RecoveredBlock block, execution::ExecutionOutcome outcome) {
    const BlockNum tip_num{tip().number()};
    ensure_invariant(block.number() == tip_num + 1, [&]() {
        return "cannot append block " + std::to_string(block.number()) + " on top of " + std::to_string(tip_num);
    });
    ensure_invariant(block.header().parent_hash == tip().hash(), "appended block parent hash does not match chain tip");
    ensure_invariant(outcome.first_block() == block.number() && outcome.len() == 1,
                     "appended outcome must cover exactly the appended block");
    outcome_.extend(std::move(outcome));
    const BlockNum block_num{block.number()};
    blocks_.emplace(block_num, std::move(block));
}

}  // namespace spindle::chain
