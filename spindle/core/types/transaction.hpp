// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/common/base.hpp>
#include <spindle/core/common/bytes.hpp>

namespace spindle {

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

// EIP-2718 transaction type
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
};

struct UnsignedTransaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt means a pre-EIP-155 transaction

    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // EIP-1559
    intx::uint256 max_fee_per_gas{0};           // gas price for pre-EIP-1559 transactions
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data{};

    std::vector<AccessListEntry> access_list{};  // EIP-2930

    intx::uint256 priority_fee_per_gas(const intx::uint256& base_fee_per_gas) const;  // EIP-1559
    intx::uint256 effective_gas_price(const intx::uint256& base_fee_per_gas) const;   // EIP-1559

    //! \brief Appends the payload covered by the signature to into
    //! \remarks into is not cleared, callers reusing a buffer must clear it first
    void encode_for_signing(Bytes& into) const;

    //! \brief keccak256 of the signing payload
    evmc::bytes32 signing_hash() const;

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

class Transaction : public UnsignedTransaction {
  public:
    bool odd_y_parity{false};
    intx::uint256 r{0}, s{0};  // signature

    intx::uint256 v() const;  // EIP-155

    //! \brief Returns false if v is not acceptable (v != 27 && v != 28 && v < 35, see EIP-155)
    bool set_v(const intx::uint256& v);

    //! \brief Hash of the network encoding (type byte prepended for typed transactions)
    evmc::bytes32 hash() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

namespace rlp {
    void encode(Bytes& to, const AccessListEntry&);
    size_t length(const AccessListEntry&);

    // EIP-2718 typed transactions are encoded as type byte || rlp(payload); within block bodies
    // they are additionally wrapped into an RLP string
    void encode(Bytes& to, const Transaction& txn, bool wrap_eip2718_into_string = true);

    size_t length(const Transaction&, bool wrap_eip2718_into_string = true);
}  // namespace rlp

}  // namespace spindle
