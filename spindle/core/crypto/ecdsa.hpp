// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <spindle/core/common/bytes.hpp>

namespace spindle::ecdsa {

inline constexpr size_t kSignatureLength{64};
inline constexpr size_t kUncompressedPublicKeyLength{65};

//! \brief Recovers the address of the key that produced a compact signature over message_hash
//! \param [in] message_hash : the 32-byte signing hash
//! \param [in] signature : r || s, both 32-byte big endian
//! \param [in] recovery_id : the y-parity (0 or 1)
//! \return std::nullopt if the signature does not parse or no public key can be recovered
//! \remarks Uses a process-wide verification context, safe for concurrent use
std::optional<evmc::address> recover_address(ByteView message_hash, ByteView signature, uint8_t recovery_id);

//! \brief Derives the account address from a 65-byte uncompressed public key (0x04 || X || Y)
evmc::address public_key_to_address(ByteView public_key);

}  // namespace spindle::ecdsa
