// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/common/base.hpp>
#include <spindle/core/common/bytes.hpp>
#include <spindle/core/types/transaction.hpp>
#include <spindle/core/types/withdrawal.hpp>

namespace spindle {

inline constexpr size_t kBloomByteLength{256};

using Bloom = std::array<uint8_t, kBloomByteLength>;

using namespace evmc::literals;

//! keccak256 of the RLP encoding of an empty list, i.e. the ommers hash of a block without ommers
inline constexpr evmc::bytes32 kEmptyListHash{0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347_bytes32};

struct BlockHeader {
    using NonceType = std::array<uint8_t, 8>;

    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};

    Bytes extra_data{};

    evmc::bytes32 prev_randao{};  // mix hash (digest) prior to EIP-4399
    NonceType nonce{};

    // Added in London
    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    // Added in Shanghai
    std::optional<evmc::bytes32> withdrawals_root{std::nullopt};  // EIP-4895

    // Added in Cancun
    std::optional<uint64_t> blob_gas_used{std::nullopt};                  // EIP-4844
    std::optional<uint64_t> excess_blob_gas{std::nullopt};                // EIP-4844
    std::optional<evmc::bytes32> parent_beacon_block_root{std::nullopt};  // EIP-4788

    //! keccak256 of the RLP encoding
    evmc::bytes32 hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

struct BlockBody {
    std::vector<Transaction> transactions;
    std::vector<BlockHeader> ommers;
    std::optional<std::vector<Withdrawal>> withdrawals{std::nullopt};

    friend bool operator==(const BlockBody&, const BlockBody&) = default;
};

struct Block : public BlockBody {
    BlockHeader header;

    friend bool operator==(const Block&, const Block&) = default;
};

namespace rlp {
    size_t length(const BlockHeader&);
    void encode(Bytes& to, const BlockHeader&);
}  // namespace rlp

}  // namespace spindle
