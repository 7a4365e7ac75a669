/**
 * @file progress_broadcaster.cpp
 * @brief ProgressBroadcaster implementation.
 */

#include "training/progress_broadcaster.hpp"

#include <algorithm>

namespace archetype {

namespace {

void erase_channel(std::vector<ChannelPtr>& set, const ChannelPtr& channel) {
    set.erase(std::remove(set.begin(), set.end(), channel), set.end());
}

}  // anonymous namespace

ProgressBroadcaster::ProgressBroadcaster(Logger& logger) : logger_(logger) {}

void ProgressBroadcaster::subscribe(const JobId& job, ChannelPtr channel) {
    if (!channel) return;
    std::lock_guard lock(mutex_);
    auto& set = subscribers_[job];
    if (std::find(set.begin(), set.end(), channel) == set.end()) {
        set.push_back(std::move(channel));
    }
}

void ProgressBroadcaster::unsubscribe(const JobId& job, const ChannelPtr& channel) {
    std::lock_guard lock(mutex_);
    auto it = subscribers_.find(job);
    if (it == subscribers_.end()) return;
    erase_channel(it->second, channel);
    if (it->second.empty()) subscribers_.erase(it);
}

size_t ProgressBroadcaster::publish(const JobId& job, const nlohmann::json& frame) {
    std::vector<ChannelPtr> targets;
    {
        std::lock_guard lock(mutex_);
        auto it = subscribers_.find(job);
        if (it == subscribers_.end()) return 0;
        targets = it->second;
    }

    std::vector<ChannelPtr> failed;
    size_t delivered = deliver(targets, frame, failed);
    if (!failed.empty()) remove_failed(&job, failed);
    return delivered;
}

void ProgressBroadcaster::subscribe_all(ChannelPtr channel) {
    if (!channel) return;
    std::lock_guard lock(mutex_);
    if (std::find(connections_.begin(), connections_.end(), channel) == connections_.end()) {
        connections_.push_back(std::move(channel));
    }
}

void ProgressBroadcaster::unsubscribe_all(const ChannelPtr& channel) {
    std::lock_guard lock(mutex_);
    erase_channel(connections_, channel);
}

size_t ProgressBroadcaster::broadcast(const nlohmann::json& frame) {
    std::vector<ChannelPtr> targets;
    {
        std::lock_guard lock(mutex_);
        targets = connections_;
    }

    std::vector<ChannelPtr> failed;
    size_t delivered = deliver(targets, frame, failed);
    if (!failed.empty()) remove_failed(nullptr, failed);
    return delivered;
}

size_t ProgressBroadcaster::subscriber_count(const JobId& job) const {
    std::lock_guard lock(mutex_);
    auto it = subscribers_.find(job);
    return it == subscribers_.end() ? 0 : it->second.size();
}

size_t ProgressBroadcaster::connection_count() const {
    std::lock_guard lock(mutex_);
    return connections_.size();
}

void ProgressBroadcaster::drop_job(const JobId& job) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(job);
}

// Sends happen outside the lock
size_t ProgressBroadcaster::deliver(const std::vector<ChannelPtr>& targets,
                                    const nlohmann::json& frame,
                                    std::vector<ChannelPtr>& failed) {
    size_t delivered = 0;
    for (const auto& channel : targets) {
        try {
            auto sent = channel->send(frame);
            if (sent) {
                ++delivered;
                continue;
            }
            logger_.debug("Dropping subscriber: " + sent.error().message);
        } catch (const std::exception& e) {
            logger_.debug(std::string{"Dropping subscriber: "} + e.what());
        }
        failed.push_back(channel);
    }
    return delivered;
}

void ProgressBroadcaster::remove_failed(const JobId* job, const std::vector<ChannelPtr>& failed) {
    std::lock_guard lock(mutex_);
    for (const auto& channel : failed) {
        if (job) {
            auto it = subscribers_.find(*job);
            if (it != subscribers_.end()) {
                erase_channel(it->second, channel);
                if (it->second.empty()) subscribers_.erase(it);
            }
        } else {
            erase_channel(connections_, channel);
        }
    }
}

}  // namespace archetype
