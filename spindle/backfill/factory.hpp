// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <spindle/backfill/backfill_job.hpp>
#include <spindle/backfill/thresholds.hpp>
#include <spindle/core/types/sender_recovery.hpp>
#include <spindle/db/provider.hpp>
#include <spindle/db/prune_mode.hpp>
#include <spindle/execution/block_executor.hpp>

namespace spindle::backfill {

inline constexpr size_t kDefaultStreamParallelism{4};

struct BackfillSettings {
    ExecutionThresholds thresholds;
    db::PruneMode prune_mode;
    size_t stream_parallelism{kDefaultStreamParallelism};
    SenderRecoveryMode sender_recovery{SenderRecoveryMode::kChecked};
};

//! Creates backfill jobs sharing one executor provider, one chain provider and one set of settings
class BackfillJobFactory {
  public:
    BackfillJobFactory(std::shared_ptr<const execution::BlockExecutorProvider> executor_provider,
                       std::shared_ptr<db::ChainProvider> provider, BackfillSettings settings = {});

    const BackfillSettings& settings() const { return settings_; }

    BackfillJob backfill(BlockRange range) const;

    //! \throws std::invalid_argument if the range is malformed
    BackfillJob backfill(BlockNum from, BlockNum to) const;

    //! \brief Job from the given block up to to or, when unset, up to the best block of the provider
    BackfillJob backfill_range(BlockNum from, std::optional<BlockNum> to = std::nullopt) const;

  private:
    std::shared_ptr<const execution::BlockExecutorProvider> executor_provider_;
    std::shared_ptr<db::ChainProvider> provider_;
    BackfillSettings settings_;
};

}  // namespace spindle::backfill
