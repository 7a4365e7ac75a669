/**
 * @file progress_broadcaster.hpp
 * @brief Fan-out of job progress frames to per-job subscriber sets.
 *
 * Two audiences:
 *   - per-job subscribers, fed by publish()
 *   - connection-wide subscribers, fed by broadcast()
 *
 * A channel whose send fails (error or exception) is dropped from the set
 * being delivered to; delivery to the remaining channels continues.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace archetype {

/**
 * @brief Anything that accepts a JSON frame.
 */
class IProgressChannel {
public:
    virtual ~IProgressChannel() = default;

    /// Error once the peer is gone; the channel is then unsubscribed.
    virtual Result<void> send(const nlohmann::json& frame) = 0;
};

using ChannelPtr = std::shared_ptr<IProgressChannel>;

class ProgressBroadcaster {
public:
    explicit ProgressBroadcaster(Logger& logger);

    ProgressBroadcaster(const ProgressBroadcaster&) = delete;
    ProgressBroadcaster& operator=(const ProgressBroadcaster&) = delete;

    void subscribe(const JobId& job, ChannelPtr channel);
    void unsubscribe(const JobId& job, const ChannelPtr& channel);

    /// Returns the number of successful deliveries.
    size_t publish(const JobId& job, const nlohmann::json& frame);

    // ── Connection-wide channels ─────────────
    void subscribe_all(ChannelPtr channel);
    void unsubscribe_all(const ChannelPtr& channel);
    size_t broadcast(const nlohmann::json& frame);

    [[nodiscard]] size_t subscriber_count(const JobId& job) const;
    [[nodiscard]] size_t connection_count() const;

    /// Forget a job's subscriber set.
    void drop_job(const JobId& job);

private:
    size_t deliver(const std::vector<ChannelPtr>& targets, const nlohmann::json& frame,
                   std::vector<ChannelPtr>& failed);
    void remove_failed(const JobId* job, const std::vector<ChannelPtr>& failed);

    Logger& logger_;
    mutable std::mutex mutex_;
    std::unordered_map<JobId, std::vector<ChannelPtr>> subscribers_;
    std::vector<ChannelPtr> connections_;
};

}  // namespace archetype
