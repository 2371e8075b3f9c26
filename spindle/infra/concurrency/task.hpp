// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

/// Defined in \spindle namespace so that we can write Task<void> foo(); everywhere
namespace spindle {

//! Asynchronous task returned by any coroutine, i.e. asynchronous operation
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace spindle
