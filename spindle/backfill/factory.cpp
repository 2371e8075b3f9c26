// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "factory.hpp"

#include <utility>

#include <spindle/infra/common/ensure.hpp>

namespace spindle::backfill {

BackfillJobFactory::BackfillJobFactory(std::shared_ptr<const execution::BlockExecutorProvider> executor_provider,
                                       std::shared_ptr<db::ChainProvider> provider, BackfillSettings settings)
    : executor_provider_{std::move(executor_provider)},
      provider_{std::move(provider)},
      settings_{std::move(settings)} {
    ensure_pre_condition(executor_provider_ && provider_, [] { return "backfill requires executor and chain providers"; });
}

BackfillJob BackfillJobFactory::backfill(BlockRange range) const {
    return BackfillJob{executor_provider_, provider_, settings_.prune_mode, settings_.thresholds, range,
                       settings_.stream_parallelism, settings_.sender_recovery};
}

BackfillJob BackfillJobFactory::backfill(BlockNum from, BlockNum to) const {
    return backfill(BlockRange{from, to});
}

BackfillJob BackfillJobFactory::backfill_range(BlockNum from, std::optional<BlockNum> to) const {
    const BlockNum end{to ? *to : provider_->best_block_number()};
    // An open range starting past the best block is simply empty
    if (!to && from > end) {
        return backfill(BlockRange{from, from - 1});
    }
    return backfill(BlockRange{from, end});
}

}  // namespace spindle::backfill
