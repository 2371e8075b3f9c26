// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <secp256k1.h>

#include <optional>

#include <gsl/pointers>

#include <spindle/core/common/bytes.hpp>

namespace spindle {

//! Compact signature (r || s) plus the recovery id needed to get the signer back
struct RecoverableSignature {
    Bytes compact;
    uint8_t recovery_id{0};
};

//! RAII owner of a libsecp256k1 context used to derive keys and sign message hashes
class SecP256K1Context final {
  public:
    static constexpr size_t kPublicKeySizeUncompressed{65};

    explicit SecP256K1Context(bool allow_verify = true, bool allow_sign = false);
    ~SecP256K1Context();

    SecP256K1Context(const SecP256K1Context&) = delete;
    SecP256K1Context& operator=(const SecP256K1Context&) = delete;

    //! \return The uncompressed public key of private_key, nullopt if the key is not a valid scalar
    std::optional<Bytes> public_key(ByteView private_key) const;

    //! \return The signature of the 32-byte message hash, nullopt on invalid input
    std::optional<RecoverableSignature> sign(ByteView message_hash, ByteView private_key) const;

  private:
    gsl::owner<secp256k1_context*> context_;
};

}  // namespace spindle
