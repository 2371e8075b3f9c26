// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <absl/container/btree_map.h>
#include <evmc/evmc.hpp>

#include <spindle/execution/block_executor.hpp>

namespace spindle::test_util {

//! \brief Executor of plain value transfers and withdrawals, charging intrinsic gas only
//! \details Contract code is never run. Blocks whose header gas_used differs from the computed one are rejected
class TransferExecutor : public execution::BlockExecutor {
  public:
    TransferExecutor(std::unique_ptr<db::StateView> state, std::optional<BlockNum> fail_at)
        : state_{std::move(state)}, fail_at_{fail_at} {}

    execution::BlockExecutionResult execute_one(const RecoveredBlock& block) override;
    size_t size_hint() const override { return bundle_.size_hint(); }
    execution::BundleState take_bundle() override;

  private:
    std::optional<Account> read_account(const evmc::address& address) const;

    std::unique_ptr<db::StateView> state_;
    std::optional<BlockNum> fail_at_;
    absl::btree_map<evmc::address, std::optional<Account>> accounts_;  // present values after the last block
    execution::BundleState bundle_;
};

class TransferExecutorProvider : public execution::BlockExecutorProvider {
  public:
    TransferExecutorProvider() = default;

    //! \param fail_at the block number at which execution throws
    explicit TransferExecutorProvider(BlockNum fail_at) : fail_at_{fail_at} {}

    std::unique_ptr<execution::BlockExecutor> executor(std::unique_ptr<db::StateView> state) const override {
        return std::make_unique<TransferExecutor>(std::move(state), fail_at_);
    }

  private:
    std::optional<BlockNum> fail_at_;
};

}  // namespace spindle::test_util
