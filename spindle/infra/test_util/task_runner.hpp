// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <spindle/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace spindle::test_util {

//! Runs Task-s to completion on a private io_context, polling it from the calling thread
class TaskRunner {
  public:
    TaskRunner() = default;
    virtual ~TaskRunner() = default;

    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = co_spawn(ioc_, std::move(task), boost::asio::use_future);
        using namespace std::chrono_literals;
        ioc_.restart();
        while (future.wait_for(0s) != std::future_status::ready) {
            ioc_.poll_one();
        }
        return future.get();
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  protected:
    boost::asio::io_context ioc_;
};

}  // namespace spindle::test_util
