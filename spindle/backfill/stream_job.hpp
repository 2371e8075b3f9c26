// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <spindle/backfill/backfill_job.hpp>

namespace spindle::backfill {

//! \brief Backfill job whose blocks are fetched ahead of execution on a worker pool
//! \details Produces exactly what the wrapped job would produce, in the same order and with the same errors
template <class Job>
class StreamBackfillJob {
  public:
    explicit StreamBackfillJob(Job job) : job_{std::move(job)} {
        job_.enable_prefetch();
    }

    auto next() { return job_.next(); }

    const BlockRange& range() const { return job_.range(); }

  private:
    Job job_;
};

}  // namespace spindle::backfill
