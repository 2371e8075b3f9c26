// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

#include <secp256k1_recovery.h>

#include <spindle/core/common/base.hpp>

namespace spindle {

static unsigned int context_flags(bool allow_verify, bool allow_sign) {
    unsigned int flags{SECP256K1_CONTEXT_NONE};
    if (allow_verify) flags |= SECP256K1_CONTEXT_VERIFY;
    if (allow_sign) flags |= SECP256K1_CONTEXT_SIGN;
    return flags;
}

SecP256K1Context::SecP256K1Context(bool allow_verify, bool allow_sign)
    : context_{secp256k1_context_create(context_flags(allow_verify, allow_sign))} {}

SecP256K1Context::~SecP256K1Context() {
    secp256k1_context_destroy(context_);
}

std::optional<Bytes> SecP256K1Context::public_key(ByteView private_key) const {
    if (private_key.size() != kHashLength || !secp256k1_ec_seckey_verify(context_, private_key.data())) {
        return std::nullopt;
    }
    secp256k1_pubkey key;
    if (!secp256k1_ec_pubkey_create(context_, &key, private_key.data())) {
        return std::nullopt;
    }
    Bytes serialized(kPublicKeySizeUncompressed, 0);
    size_t size{serialized.size()};
    secp256k1_ec_pubkey_serialize(context_, serialized.data(), &size, &key, SECP256K1_EC_UNCOMPRESSED);
    return serialized;
}

std::optional<RecoverableSignature> SecP256K1Context::sign(ByteView message_hash, ByteView private_key) const {
    if (message_hash.size() != kHashLength || private_key.size() != kHashLength) {
        return std::nullopt;
    }
    secp256k1_ecdsa_recoverable_signature signature;
    if (!secp256k1_ecdsa_sign_recoverable(context_, &signature, message_hash.data(), private_key.data(), nullptr,
                                          nullptr)) {
        return std::nullopt;
    }
    RecoverableSignature result{.compact = Bytes(64, 0)};
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(context_, result.compact.data(), &recovery_id, &signature);
    result.recovery_id = static_cast<uint8_t>(recovery_id);
    return result;
}

}  // namespace spindle
