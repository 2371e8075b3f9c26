// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace spindle {
[[noreturn]] void abort_due_to_assertion_failure(char const* expr, char const* file, int line);
}

// SPINDLE_ASSERT always aborts program execution on assertion failure, even when NDEBUG is defined.
#define SPINDLE_ASSERT(expr)  \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::spindle::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
