// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "executed_block.hpp"

#include <utility>
#include <vector>

#include <spindle/core/common/util.hpp>
#include <spindle/execution/execution_error.hpp>
#include <spindle/infra/common/ensure.hpp>

namespace spindle::chain {

ExecutedBlock::ExecutedBlock(std::shared_ptr<const RecoveredBlock> recovered_block,
                             std::shared_ptr<const execution::ExecutionOutcome> execution_outcome,
                             std::shared_ptr<const trie::HashedPostState> hashed_post_state,
                             std::shared_ptr<const trie::TrieUpdates> trie_updates)
    : recovered_block_{std::move(recovered_block)},
      execution_outcome_{std::move(execution_outcome)},
      hashed_post_state_{std::move(hashed_post_state)},
      trie_updates_{std::move(trie_updates)} {
    ensure_pre_condition(recovered_block_ && execution_outcome_ && hashed_post_state_ && trie_updates_,
                         [] { return "executed block parts must not be null"; });
}

ExecutedBlock ExecutedBlock::from_output(RecoveredBlock block, execution::BlockExecutionOutput output,
                                         const trie::StateRootProvider* state_root_provider) {
    auto hashed_post_state{std::make_shared<const trie::HashedPostState>(
        trie::HashedPostState::from_bundle_state(output.state))};

    trie::TrieUpdates trie_updates;
    if (state_root_provider) {
        trie::StateRootOutput root_output{state_root_provider->state_root_with_updates(*hashed_post_state)};
        if (root_output.root != block.header().state_root) {
            throw execution::BlockExecutionError{
                execution::ExecutionErrorCode::kStateRootMismatch, block.number(),
                "computed " + to_hex(root_output.root, true) + " header " + to_hex(block.header().state_root, true)};
        }
        trie_updates = std::move(root_output.updates);
    }

    const BlockNum block_num{block.number()};
    std::vector<Receipts> receipts;
    receipts.push_back(std::move(output.result.receipts));
    return ExecutedBlock{
        std::make_shared<const RecoveredBlock>(std::move(block)),
        std::make_shared<const execution::ExecutionOutcome>(std::move(output.state), std::move(receipts), block_num),
        std::move(hashed_post_state),
        std::make_shared<const trie::TrieUpdates>(std::move(trie_updates)),
    };
}

}  // namespace spindle::chain
