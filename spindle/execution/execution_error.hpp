// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <spindle/core/common/base.hpp>

namespace spindle::execution {

enum class ExecutionErrorCode {
    kBlockNotFound,      // the provider has no block at the requested height
    kStateUnavailable,   // no historical state at the parent of the first block
    kExecutionFailed,    // the executor rejected the block
    kInvalidSignature,   // a transaction signer could not be recovered
    kProviderFailure,    // the provider backend failed while fetching the block
    kStateRootMismatch,  // computed post-state root differs from the header one
};

//! Fatal failure of a backfill job while processing one block
class BlockExecutionError : public std::runtime_error {
  public:
    BlockExecutionError(ExecutionErrorCode code, BlockNum block_num, std::string cause = "");

    ExecutionErrorCode code() const noexcept { return code_; }
    BlockNum block_num() const noexcept { return block_num_; }
    const std::string& cause() const noexcept { return cause_; }

  private:
    ExecutionErrorCode code_;
    BlockNum block_num_;
    std::string cause_;
};

}  // namespace spindle::execution
