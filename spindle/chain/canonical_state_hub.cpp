// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "canonical_state_hub.hpp"

#include <string>
#include <utility>

#include <spindle/infra/common/log.hpp>

namespace spindle::chain {

CanonStateNotificationStream::CanonStateNotificationStream(std::shared_ptr<NotificationChannel> channel)
    : channel_{std::move(channel)} {}

CanonStateNotificationStream::~CanonStateNotificationStream() {
    if (channel_) {
        channel_->close();
    }
}

CanonStateNotificationStream& CanonStateNotificationStream::operator=(CanonStateNotificationStream&& other) noexcept {
    if (this != &other) {
        if (channel_) {
            channel_->close();
        }
        channel_ = std::move(other.channel_);
    }
    return *this;
}

Task<CanonStateNotification> CanonStateNotificationStream::receive() {
    std::shared_ptr<const CanonStateNotification> notification{co_await channel_->receive()};
    co_return *notification;
}

std::optional<CanonStateNotification> CanonStateNotificationStream::try_receive() {
    std::optional<std::shared_ptr<const CanonStateNotification>> notification{channel_->try_receive()};
    if (!notification) return std::nullopt;
    return **notification;
}

CanonicalStateHub::CanonicalStateHub(boost::asio::any_io_executor executor, size_t channel_capacity)
    : executor_{std::move(executor)}, channel_capacity_{channel_capacity} {}

CanonStateNotificationStream CanonicalStateHub::subscribe() {
    auto channel{std::make_shared<NotificationChannel>(executor_, channel_capacity_)};
    std::scoped_lock lock{mutex_};
    channels_.push_back(channel);
    SPINDLE_DEBUG_M("CanonicalStateHub", {"op", "subscribe", "subscribers", std::to_string(channels_.size())});
    return CanonStateNotificationStream{std::move(channel)};
}

void CanonicalStateHub::publish(CanonStateNotification notification) {
    const auto shared{std::make_shared<const CanonStateNotification>(std::move(notification))};

    std::scoped_lock lock{mutex_};
    for (auto it = channels_.begin(); it != channels_.end();) {
        if ((*it)->try_send(shared)) {
            ++it;
            continue;
        }
        SPINDLE_TRACE_M("CanonicalStateHub", {"op", "drop subscriber", "reason", (*it)->is_open() ? "buffer full" : "closed"});
        (*it)->close();
        it = channels_.erase(it);
    }
}

void CanonicalStateHub::publish_commit(std::shared_ptr<const Chain> new_chain) {
    publish(CanonStateNotification::commit(std::move(new_chain)));
}

void CanonicalStateHub::publish_reorg(std::shared_ptr<const Chain> old_chain, std::shared_ptr<const Chain> new_chain) {
    publish(CanonStateNotification::reorg(std::move(old_chain), std::move(new_chain)));
}

size_t CanonicalStateHub::subscriber_count() const {
    std::scoped_lock lock{mutex_};
    return channels_.size();
}

}  // namespace spindle::chain
