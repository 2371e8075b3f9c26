// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "task.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace spindle::concurrency {

//! \brief Bounded multi-producer multi-consumer channel of T values
//! \details Cancellation surfaces as operation_canceled. Closing keeps buffered values readable, after which
//! receiving throws channel_closed.
template <typename T>
class Channel {
  public:
    Channel(const boost::asio::any_io_executor& executor, size_t capacity) : channel_(executor, capacity) {}

    Task<void> send(T value) {
        try {
            co_await channel_.async_send(boost::system::error_code{}, std::move(value), boost::asio::use_awaitable);
        } catch (const boost::system::system_error& ex) {
            rethrow_translated(ex.code());
        }
    }

    //! \return false if the buffer is full or the channel is closed
    bool try_send(T value) {
        return channel_.try_send(boost::system::error_code{}, std::move(value));
    }

    Task<T> receive() {
        std::optional<T> value;
        try {
            value = co_await channel_.async_receive(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& ex) {
            rethrow_translated(ex.code());
        }
        co_return std::move(*value);
    }

    //! \return The next buffered value, nullopt if none is buffered on an open channel
    std::optional<T> try_receive() {
        std::optional<T> result;
        channel_.try_receive([&](const boost::system::error_code& error, T&& value) {
            if (error) rethrow_translated(error);
            result = std::move(value);
        });
        return result;
    }

    bool is_open() const { return channel_.is_open(); }

    void close() { channel_.close(); }

  private:
    [[noreturn]] static void rethrow_translated(const boost::system::error_code& error) {
        if (error == boost::asio::experimental::error::channel_cancelled) {
            throw boost::system::system_error{make_error_code(boost::system::errc::operation_canceled)};
        }
        throw boost::system::system_error{error};
    }

    boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
};

}  // namespace spindle::concurrency
