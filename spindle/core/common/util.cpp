// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

namespace spindle {

ByteView zeroless_view(ByteView data) {
    const auto is_zero_byte = [](const auto& b) { return b == 0x0; };
    const auto first_nonzero_byte_it{std::ranges::find_if_not(data, is_zero_byte)};
    return data.substr(static_cast<size_t>(std::distance(data.begin(), first_nonzero_byte_it)));
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string to_hex(const evmc::address& address, bool with_prefix) {
    return to_hex(ByteView{address.bytes}, with_prefix);
}

std::string to_hex(const evmc::bytes32& hash, bool with_prefix) {
    return to_hex(ByteView{hash.bytes}, with_prefix);
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos(hex.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, '\0');
    auto src{hex.begin()};
    auto dst{out.begin()};
    if (pos) {
        auto lo{decode_hex_digit(*src++)};
        if (!lo) return std::nullopt;
        *dst++ = *lo;
    }
    while (src != hex.end()) {
        auto hi{decode_hex_digit(*src++)};
        auto lo{decode_hex_digit(*src++)};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>(*hi << 4 | *lo);
    }
    return out;
}

evmc::bytes32 keccak256_hash(ByteView view) {
    evmc::bytes32 out;
    const ethash::hash256 digest{keccak256(view)};
    std::memcpy(out.bytes, digest.bytes, kHashLength);
    return out;
}

}  // namespace spindle
