// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/common/base.hpp>
#include <spindle/core/common/bytes.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << "0x" << intx::hex(value);
    return out;
}

}  // namespace intx

namespace spindle {

//! \brief Strips leftmost zeroed bytes from byte sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

std::string to_hex(const evmc::address& address, bool with_prefix = false);

std::string to_hex(const evmc::bytes32& hash, bool with_prefix = false);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes an hex string, with or without 0x prefix; odd length is left-padded
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

//! \brief keccak256 of the provided bytes as evmc::bytes32
evmc::bytes32 keccak256_hash(ByteView view);

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

}  // namespace spindle
