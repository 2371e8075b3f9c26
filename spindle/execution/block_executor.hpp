// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <spindle/core/types/recovered_block.hpp>
#include <spindle/db/provider.hpp>
#include <spindle/execution/bundle_state.hpp>
#include <spindle/execution/execution_outcome.hpp>

namespace spindle::execution {

//! \brief Execution session bound to one state view, accumulating the state diff of the blocks it runs
//! \details Implementations throw on invalid blocks; failures surfaced as BlockExecutionError keep their code
class BlockExecutor {
  public:
    virtual ~BlockExecutor() = default;

    //! \brief Executes the block on top of the state accumulated so far
    virtual BlockExecutionResult execute_one(const RecoveredBlock& block) = 0;

    //! \brief Estimated number of state entries accumulated so far
    virtual size_t size_hint() const = 0;

    //! \brief Hands out the accumulated state diff, leaving the session empty
    virtual BundleState take_bundle() = 0;

    //! \brief Executes a single block and returns its result together with the state diff
    BlockExecutionOutput execute(const RecoveredBlock& block) {
        BlockExecutionResult result{execute_one(block)};
        return {std::move(result), take_bundle()};
    }
};

//! Creates execution sessions
class BlockExecutorProvider {
  public:
    virtual ~BlockExecutorProvider() = default;

    virtual std::unique_ptr<BlockExecutor> executor(std::unique_ptr<db::StateView> state) const = 0;
};

}  // namespace spindle::execution
