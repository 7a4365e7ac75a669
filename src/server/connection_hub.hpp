/**
 * @file connection_hub.hpp
 * @brief Push streams: queued subscriber channels and their connection loop.
 *
 * A StreamChannel is what the broadcaster sees. send() only queues the
 * serialized frame, so publishing never waits on a socket. The connection's
 * worker drains the queue into chunked NDJSON and watches the client side
 * for lines to echo or for a disconnect.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "server/http_message.hpp"
#include "training/progress_broadcaster.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace archetype {

class ChunkedStream;

class StreamChannel : public IProgressChannel {
public:
    explicit StreamChannel(size_t max_pending = 256);

    /// Queues the frame. Fails once closed, or when the reader has fallen max_pending frames behind.
    Result<void> send(const nlohmann::json& frame) override;

    /// Next queued line, waiting up to @p timeout. nullopt on timeout or once closed and drained.
    std::optional<std::string> next(std::chrono::milliseconds timeout);

    void close();
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    size_t max_pending_;
    bool closed_{false};
};

class ConnectionHub {
public:
    struct Options {
        uint32_t max_streams = 32;
        size_t max_pending_frames = 256;
        std::chrono::milliseconds poll_interval{100};
    };

    ConnectionHub(ProgressBroadcaster& broadcaster, Logger& logger, Options options);
    ~ConnectionHub();

    ConnectionHub(const ConnectionHub&) = delete;
    ConnectionHub& operator=(const ConnectionHub&) = delete;

    /// Connection-wide stream: every broadcast event, and echoes of client lines.
    Result<HttpResponse> open_connection_stream();

    /// Per-job progress stream: subscribed on connect, unsubscribed on disconnect.
    Result<HttpResponse> open_job_stream(const JobId& job);

    /// Close every open stream; their loops end at the next poll.
    void close_all();

    [[nodiscard]] size_t active_streams() const noexcept { return active_.load(); }

private:
    class Lease;

    Result<std::shared_ptr<Lease>> reserve(std::optional<JobId> job);
    void release(const std::shared_ptr<StreamChannel>& channel);

    /// Drain frames and client input until either side closes.
    void pump(StreamChannel& channel, ChunkedStream& out, bool echo);

    ProgressBroadcaster& broadcaster_;
    Logger& logger_;
    Options options_;

    std::atomic<uint32_t> active_{0};
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<StreamChannel>> open_;
};

}  // namespace archetype
