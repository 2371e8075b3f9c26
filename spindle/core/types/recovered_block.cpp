// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "recovered_block.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace spindle {

SealedBlock SealedBlock::seal_slow(Block block) {
    const evmc::bytes32 block_hash{block.header.hash()};
    return SealedBlock{.block = std::move(block), .hash = block_hash};
}

RecoveredBlock::RecoveredBlock(SealedBlock sealed, std::vector<evmc::address> senders)
    : sealed_{std::move(sealed)}, senders_{std::move(senders)} {
    if (senders_.size() != sealed_.block.transactions.size()) {
        throw std::invalid_argument("block " + std::to_string(sealed_.number()) + " has " +
                                    std::to_string(sealed_.block.transactions.size()) + " transactions but " +
                                    std::to_string(senders_.size()) + " senders");
    }
}

tl::expected<RecoveredBlock, SendersRecoveryError> RecoveredBlock::try_recover(SealedBlock sealed, SenderRecoveryMode mode) {
    auto senders{recover_senders(sealed.block.transactions, mode)};
    if (!senders) {
        return tl::unexpected{senders.error()};
    }
    return RecoveredBlock{std::move(sealed), std::move(*senders)};
}

void RecoveredBlock::with_transaction_hashes() {
    if (transaction_hashes_) return;
    std::vector<evmc::bytes32> hashes;
    hashes.reserve(sealed_.block.transactions.size());
    for (const auto& txn : sealed_.block.transactions) {
        hashes.push_back(txn.hash());
    }
    transaction_hashes_ = std::move(hashes);
}

}  // namespace spindle
