// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "execution_error.hpp"

#include <utility>

#include <magic_enum.hpp>

namespace spindle::execution {

static std::string make_message(ExecutionErrorCode code, BlockNum block_num, const std::string& cause) {
    std::string message{magic_enum::enum_name(code)};
    message += " at block " + std::to_string(block_num);
    if (!cause.empty()) {
        message += ": " + cause;
    }
    return message;
}

BlockExecutionError::BlockExecutionError(ExecutionErrorCode code, BlockNum block_num, std::string cause)
    : std::runtime_error{make_message(code, block_num, cause)},
      code_{code},
      block_num_{block_num},
      cause_{std::move(cause)} {}

}  // namespace spindle::execution
