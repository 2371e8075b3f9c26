// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <algorithm>

#include <spindle/core/common/assert.hpp>
#include <spindle/core/common/util.hpp>
#include <spindle/core/rlp/encode.hpp>

namespace spindle {

// https://eips.ethereum.org/EIPS/eip-155
intx::uint256 Transaction::v() const {
    if (type != TransactionType::kLegacy) {
        return odd_y_parity ? 1 : 0;
    }
    if (chain_id) {
        return *chain_id * 2 + 35 + (odd_y_parity ? 1 : 0);
    }
    return odd_y_parity ? 28 : 27;
}

// https://eips.ethereum.org/EIPS/eip-155
bool Transaction::set_v(const intx::uint256& v) {
    if (v == 27 || v == 28) {
        odd_y_parity = v == 28;
        chain_id = std::nullopt;
        return true;
    }
    if (v < 35) {
        return false;
    }
    // v = chain_id * 2 + 35 + odd
    odd_y_parity = (static_cast<uint64_t>(v - 35) & 1) == 1;
    chain_id = (v - 35) >> 1;
    return true;
}

namespace rlp {

    static size_t storage_keys_length(const std::vector<evmc::bytes32>& keys) {
        const size_t payload_length{keys.size() * (kHashLength + 1)};
        return length_of_length(payload_length) + payload_length;
    }

    static Header header(const AccessListEntry& e) {
        return {.list = true, .payload_length = kAddressLength + 1 + storage_keys_length(e.storage_keys)};
    }

    size_t length(const AccessListEntry& e) {
        const Header h{header(e)};
        return length_of_length(h.payload_length) + h.payload_length;
    }

    void encode(Bytes& to, const AccessListEntry& e) {
        encode_header(to, header(e));
        encode(to, e.account);
        encode(to, std::span<const evmc::bytes32>{e.storage_keys});
    }

    static size_t access_list_payload_length(const std::vector<AccessListEntry>& access_list) {
        size_t payload_length{0};
        for (const auto& e : access_list) {
            payload_length += length(e);
        }
        return payload_length;
    }

    static void encode_access_list(Bytes& to, const std::vector<AccessListEntry>& access_list) {
        encode_header(to, {.list = true, .payload_length = access_list_payload_length(access_list)});
        for (const auto& e : access_list) {
            encode(to, e);
        }
    }

    static Header header_base(const UnsignedTransaction& txn) {
        Header h{.list = true};

        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += length(txn.chain_id.value_or(0));
        }

        h.payload_length += length(txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            h.payload_length += length(txn.max_priority_fee_per_gas);
        }
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += txn.to ? (kAddressLength + 1) : 1;
        h.payload_length += length(txn.value);
        h.payload_length += length(ByteView{txn.data});

        if (txn.type != TransactionType::kLegacy) {
            const size_t access_list_payload{access_list_payload_length(txn.access_list)};
            h.payload_length += length_of_length(access_list_payload) + access_list_payload;
        }
        return h;
    }

    static Header header_for_signing(const UnsignedTransaction& txn) {
        Header h{header_base(txn)};
        if (txn.type == TransactionType::kLegacy && txn.chain_id) {
            h.payload_length += length(*txn.chain_id) + 2;
        }
        return h;
    }

    static Header header(const Transaction& txn) {
        Header h{header_base(txn)};
        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += length(txn.odd_y_parity);
        } else {
            h.payload_length += length(txn.v());
        }
        h.payload_length += length(txn.r);
        h.payload_length += length(txn.s);
        return h;
    }

    size_t length(const Transaction& txn, bool wrap_eip2718_into_string) {
        const Header h{header(txn)};
        const size_t rlp_len{length_of_length(h.payload_length) + h.payload_length};
        if (txn.type != TransactionType::kLegacy && wrap_eip2718_into_string) {
            return length_of_length(rlp_len + 1) + rlp_len + 1;
        }
        return rlp_len;
    }

    static void legacy_encode_base(Bytes& to, const UnsignedTransaction& txn) {
        encode(to, txn.nonce);
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        if (txn.to) {
            encode(to, *txn.to);
        } else {
            to.push_back(kEmptyStringCode);
        }
        encode(to, txn.value);
        encode(to, ByteView{txn.data});
    }

    static void eip2718_encode_base(Bytes& to, const UnsignedTransaction& txn, const Header h,
                                    bool wrap_eip2718_into_string) {
        if (wrap_eip2718_into_string) {
            const size_t rlp_len{length_of_length(h.payload_length) + h.payload_length};
            encode_header(to, {.list = false, .payload_length = rlp_len + 1});
        }

        to.push_back(static_cast<uint8_t>(txn.type));
        encode_header(to, h);
        encode(to, txn.chain_id.value_or(0));
        encode(to, txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            encode(to, txn.max_priority_fee_per_gas);
        }
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        if (txn.to) {
            encode(to, *txn.to);
        } else {
            to.push_back(kEmptyStringCode);
        }
        encode(to, txn.value);
        encode(to, ByteView{txn.data});
        encode_access_list(to, txn.access_list);
    }

    void encode(Bytes& to, const Transaction& txn, bool wrap_eip2718_into_string) {
        if (txn.type == TransactionType::kLegacy) {
            encode_header(to, header(txn));
            legacy_encode_base(to, txn);
            encode(to, txn.v());
        } else {
            eip2718_encode_base(to, txn, header(txn), wrap_eip2718_into_string);
            encode(to, txn.odd_y_parity);
        }
        encode(to, txn.r);
        encode(to, txn.s);
    }

}  // namespace rlp

void UnsignedTransaction::encode_for_signing(Bytes& into) const {
    if (type == TransactionType::kLegacy) {
        rlp::encode_header(into, rlp::header_for_signing(*this));
        rlp::legacy_encode_base(into, *this);
        if (chain_id) {
            rlp::encode(into, *chain_id);
            rlp::encode(into, 0u);
            rlp::encode(into, 0u);
        }
    } else {
        rlp::eip2718_encode_base(into, *this, rlp::header_for_signing(*this), /*wrap_eip2718_into_string=*/false);
    }
}

evmc::bytes32 UnsignedTransaction::signing_hash() const {
    Bytes rlp;
    encode_for_signing(rlp);
    return keccak256_hash(rlp);
}

evmc::bytes32 Transaction::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this, /*wrap_eip2718_into_string=*/false);
    return keccak256_hash(rlp);
}

intx::uint256 UnsignedTransaction::priority_fee_per_gas(const intx::uint256& base_fee_per_gas) const {
    SPINDLE_ASSERT(max_fee_per_gas >= base_fee_per_gas);
    return std::min(max_priority_fee_per_gas, max_fee_per_gas - base_fee_per_gas);
}

intx::uint256 UnsignedTransaction::effective_gas_price(const intx::uint256& base_fee_per_gas) const {
    if (type != TransactionType::kDynamicFee) {
        return max_fee_per_gas;
    }
    return priority_fee_per_gas(base_fee_per_gas) + base_fee_per_gas;
}

}  // namespace spindle
