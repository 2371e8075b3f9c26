// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <list>
#include <memory>
#include <mutex>
#include <optional>

#include <boost/asio/any_io_executor.hpp>

#include <spindle/chain/canon_state_notification.hpp>
#include <spindle/infra/concurrency/channel.hpp>
#include <spindle/infra/concurrency/task.hpp>

namespace spindle::chain {

inline constexpr size_t kCanonStateNotificationCapacity{100};

using NotificationChannel = concurrency::Channel<std::shared_ptr<const CanonStateNotification>>;

//! \brief Receiving end of a subscription, closing it when destroyed
class CanonStateNotificationStream {
  public:
    explicit CanonStateNotificationStream(std::shared_ptr<NotificationChannel> channel);
    ~CanonStateNotificationStream();

    CanonStateNotificationStream(CanonStateNotificationStream&&) = default;
    CanonStateNotificationStream& operator=(CanonStateNotificationStream&&) noexcept;

    CanonStateNotificationStream(const CanonStateNotificationStream&) = delete;
    CanonStateNotificationStream& operator=(const CanonStateNotificationStream&) = delete;

    //! \brief Waits for the next notification
    //! \throws boost::system::system_error when the channel has been closed and drained
    Task<CanonStateNotification> receive();

    //! \brief Next buffered notification, if any
    //! \throws boost::system::system_error when the hub dropped the subscription and the buffer is drained
    std::optional<CanonStateNotification> try_receive();

  private:
    std::shared_ptr<NotificationChannel> channel_;
};

//! \brief Fans canonical chain transitions out to any number of subscribers
//! \details Each subscriber gets a bounded buffer. A subscriber whose buffer is full or whose stream was dropped
//! is removed on the next publish. Notifications published before subscribing are not replayed.
class CanonicalStateHub {
  public:
    explicit CanonicalStateHub(boost::asio::any_io_executor executor,
                               size_t channel_capacity = kCanonStateNotificationCapacity);

    CanonStateNotificationStream subscribe();

    void publish(CanonStateNotification notification);
    void publish_commit(std::shared_ptr<const Chain> new_chain);
    void publish_reorg(std::shared_ptr<const Chain> old_chain, std::shared_ptr<const Chain> new_chain);

    size_t subscriber_count() const;

  private:
    boost::asio::any_io_executor executor_;
    size_t channel_capacity_;
    mutable std::mutex mutex_;
    std::list<std::shared_ptr<NotificationChannel>> channels_;
};

}  // namespace spindle::chain
