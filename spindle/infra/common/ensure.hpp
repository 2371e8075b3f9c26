// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace spindle {

namespace detail {
    template <class Exception>
    [[noreturn]] void raise(std::string_view prefix, std::string message) {
        message.insert(0, prefix);
        throw Exception{message};
    }
}  // namespace detail

using MessageBuilder = std::function<std::string()>;

//! Throws std::logic_error with message unless condition holds
template <unsigned int N>
inline void ensure(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] detail::raise<std::logic_error>("", message);
}

//! Lazy message variant, e.g. `ensure(ok, [&]() { return "bad block " + std::to_string(n); });`
inline void ensure(bool condition, const MessageBuilder& message) {
    if (!condition) [[unlikely]] detail::raise<std::logic_error>("", message());
}

//! Structural invariant check, e.g. contiguity of an executed chain
template <unsigned int N>
inline void ensure_invariant(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] detail::raise<std::logic_error>("Invariant violation: ", message);
}

inline void ensure_invariant(bool condition, const MessageBuilder& message) {
    if (!condition) [[unlikely]] detail::raise<std::logic_error>("Invariant violation: ", message());
}

//! Argument check throwing std::invalid_argument
inline void ensure_pre_condition(bool condition, const MessageBuilder& message) {
    if (!condition) [[unlikely]] detail::raise<std::invalid_argument>("Pre-condition violation: ", message());
}

}  // namespace spindle
