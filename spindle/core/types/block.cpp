// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <spindle/core/common/util.hpp>
#include <spindle/core/rlp/encode.hpp>

namespace spindle {

evmc::bytes32 BlockHeader::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this);
    return keccak256_hash(rlp);
}

namespace rlp {

    static Header rlp_header(const BlockHeader& header) {
        Header rlp_head{.list = true};
        rlp_head.payload_length += kHashLength + 1;                                        // parent_hash
        rlp_head.payload_length += kHashLength + 1;                                        // ommers_hash
        rlp_head.payload_length += kAddressLength + 1;                                     // beneficiary
        rlp_head.payload_length += kHashLength + 1;                                        // state_root
        rlp_head.payload_length += kHashLength + 1;                                        // transactions_root
        rlp_head.payload_length += kHashLength + 1;                                        // receipts_root
        rlp_head.payload_length += kBloomByteLength + length_of_length(kBloomByteLength);  // logs_bloom
        rlp_head.payload_length += length(header.difficulty);
        rlp_head.payload_length += length(header.number);
        rlp_head.payload_length += length(header.gas_limit);
        rlp_head.payload_length += length(header.gas_used);
        rlp_head.payload_length += length(header.timestamp);
        rlp_head.payload_length += length(ByteView{header.extra_data});
        rlp_head.payload_length += kHashLength + 1;  // prev_randao
        rlp_head.payload_length += 8 + 1;            // nonce
        if (header.base_fee_per_gas) {
            rlp_head.payload_length += length(*header.base_fee_per_gas);
        }
        if (header.withdrawals_root) {
            rlp_head.payload_length += kHashLength + 1;
        }
        if (header.blob_gas_used) {
            rlp_head.payload_length += length(*header.blob_gas_used);
        }
        if (header.excess_blob_gas) {
            rlp_head.payload_length += length(*header.excess_blob_gas);
        }
        if (header.parent_beacon_block_root) {
            rlp_head.payload_length += kHashLength + 1;
        }
        return rlp_head;
    }

    size_t length(const BlockHeader& header) {
        const Header rlp_head{rlp_header(header)};
        return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
    }

    void encode(Bytes& to, const BlockHeader& header) {
        encode_header(to, rlp_header(header));
        encode(to, header.parent_hash);
        encode(to, header.ommers_hash);
        encode(to, header.beneficiary);
        encode(to, header.state_root);
        encode(to, header.transactions_root);
        encode(to, header.receipts_root);
        encode(to, ByteView{header.logs_bloom});
        encode(to, header.difficulty);
        encode(to, header.number);
        encode(to, header.gas_limit);
        encode(to, header.gas_used);
        encode(to, header.timestamp);
        encode(to, ByteView{header.extra_data});
        encode(to, header.prev_randao);
        encode(to, ByteView{header.nonce});
        if (header.base_fee_per_gas) {
            encode(to, *header.base_fee_per_gas);
        }
        if (header.withdrawals_root) {
            encode(to, *header.withdrawals_root);
        }
        if (header.blob_gas_used) {
            encode(to, *header.blob_gas_used);
        }
        if (header.excess_blob_gas) {
            encode(to, *header.excess_blob_gas);
        }
        if (header.parent_beacon_block_root) {
            encode(to, *header.parent_beacon_block_root);
        }
    }

}  // namespace rlp

}  // namespace spindle
