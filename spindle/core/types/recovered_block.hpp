// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <spindle/core/types/block.hpp>
#include <spindle/core/types/sender_recovery.hpp>

namespace spindle {

//! A block together with its header hash, computed once
struct SealedBlock {
    Block block;
    evmc::bytes32 hash{};

    //! Hashes the header and seals the block
    static SealedBlock seal_slow(Block block);

    BlockNum number() const { return block.header.number; }
    const BlockHeader& header() const { return block.header; }

    friend bool operator==(const SealedBlock&, const SealedBlock&) = default;
};

//! A sealed block with one recovered sender per transaction, in transaction order
class RecoveredBlock {
  public:
    //! \throws std::invalid_argument if the sender count differs from the transaction count
    RecoveredBlock(SealedBlock sealed, std::vector<evmc::address> senders);

    //! \brief Recovers all senders of the given block
    static tl::expected<RecoveredBlock, SendersRecoveryError> try_recover(SealedBlock sealed, SenderRecoveryMode mode);

    const SealedBlock& sealed_block() const { return sealed_; }
    const Block& block() const { return sealed_.block; }
    const BlockHeader& header() const { return sealed_.block.header; }
    const evmc::bytes32& hash() const { return sealed_.hash; }
    BlockNum number() const { return sealed_.block.header.number; }
    const std::vector<evmc::address>& senders() const { return senders_; }

    //! Transaction hashes, present only once computed by with_transaction_hashes()
    const std::optional<std::vector<evmc::bytes32>>& transaction_hashes() const { return transaction_hashes_; }
    void with_transaction_hashes();

    friend bool operator==(const RecoveredBlock&, const RecoveredBlock&) = default;

  private:
    SealedBlock sealed_;
    std::vector<evmc::address> senders_;
    std::optional<std::vector<evmc::bytes32>> transaction_hashes_;
};

}  // namespace spindle
