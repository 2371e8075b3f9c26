// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <cstring>

#include <spindle/core/common/assert.hpp>
#include <spindle/core/common/base.hpp>
#include <spindle/core/common/util.hpp>

namespace spindle::ecdsa {

// Read-only after creation: libsecp256k1 allows concurrent verification on a const context
static const secp256k1_context* verify_context() {
    static const secp256k1_context* context{secp256k1_context_create(SECP256K1_CONTEXT_VERIFY)};
    return context;
}

std::optional<evmc::address> recover_address(ByteView message_hash, ByteView signature, uint8_t recovery_id) {
    if (message_hash.size() != kHashLength || signature.size() != kSignatureLength || recovery_id > 3) {
        return std::nullopt;
    }
    const secp256k1_context* context{verify_context()};

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context, &sig, signature.data(), recovery_id)) {
        return std::nullopt;
    }

    secp256k1_pubkey pub_key;
    if (!secp256k1_ecdsa_recover(context, &pub_key, &sig, message_hash.data())) {
        return std::nullopt;
    }

    size_t out_len{kUncompressedPublicKeyLength};
    uint8_t serialized[kUncompressedPublicKeyLength];
    secp256k1_ec_pubkey_serialize(context, serialized, &out_len, &pub_key, SECP256K1_EC_UNCOMPRESSED);
    return public_key_to_address(ByteView{serialized, out_len});
}

evmc::address public_key_to_address(ByteView public_key) {
    SPINDLE_ASSERT(public_key.size() == kUncompressedPublicKeyLength && public_key[0] == 0x04);
    const ethash::hash256 key_hash{keccak256(public_key.substr(1))};
    evmc::address out;
    std::memcpy(out.bytes, &key_hash.bytes[kHashLength - kAddressLength], kAddressLength);
    return out;
}

}  // namespace spindle::ecdsa
