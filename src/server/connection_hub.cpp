/**
 * @file connection_hub.cpp
 * @brief StreamChannel and ConnectionHub implementation.
 */

#include "server/connection_hub.hpp"
#include "server/http_server.hpp"

#include <algorithm>

namespace archetype {

// ─────────────────────────────────────────────
// StreamChannel
// ─────────────────────────────────────────────

StreamChannel::StreamChannel(size_t max_pending) : max_pending_(max_pending) {}

Result<void> StreamChannel::send(const nlohmann::json& frame) {
    auto line = dump_json(frame);
    line.push_back('\n');
    {
        std::lock_guard lock(mutex_);
        if (closed_) return Error{ErrorCode::Io, "Stream closed"};
        if (queue_.size() >= max_pending_) {
            closed_ = true;
            cv_.notify_all();
            return Error{ErrorCode::Unavailable, "Subscriber fell behind"};
        }
        queue_.push_back(std::move(line));
    }
    cv_.notify_one();
    return {};
}

std::optional<std::string> StreamChannel::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto line = std::move(queue_.front());
    queue_.pop_front();
    return line;
}

void StreamChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool StreamChannel::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t StreamChannel::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

// ─────────────────────────────────────────────
// Lease: one reserved stream slot
// ─────────────────────────────────────────────

class ConnectionHub::Lease {
public:
    Lease(ConnectionHub& hub, std::shared_ptr<StreamChannel> channel, std::optional<JobId> job)
        : hub_(hub), channel_(std::move(channel)), job_(std::move(job)) {
        if (job_) {
            hub_.broadcaster_.subscribe(*job_, channel_);
        } else {
            hub_.broadcaster_.subscribe_all(channel_);
        }
    }

    ~Lease() {
        if (job_) {
            hub_.broadcaster_.unsubscribe(*job_, channel_);
        } else {
            hub_.broadcaster_.unsubscribe_all(channel_);
        }
        channel_->close();
        hub_.release(channel_);
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    [[nodiscard]] StreamChannel& channel() noexcept { return *channel_; }
    [[nodiscard]] const std::optional<JobId>& job() const noexcept { return job_; }

private:
    ConnectionHub& hub_;
    std::shared_ptr<StreamChannel> channel_;
    std::optional<JobId> job_;
};

// ─────────────────────────────────────────────
// ConnectionHub
// ─────────────────────────────────────────────

ConnectionHub::ConnectionHub(ProgressBroadcaster& broadcaster, Logger& logger, Options options)
    : broadcaster_(broadcaster)
    , logger_(logger)
    , options_(options) {}

ConnectionHub::~ConnectionHub() {
    close_all();
}

Result<std::shared_ptr<ConnectionHub::Lease>> ConnectionHub::reserve(std::optional<JobId> job) {
    uint32_t current = active_.load();
    do {
        if (current >= options_.max_streams) {
            return Error{ErrorCode::Unavailable,
                         "Too many open streams (limit " + std::to_string(options_.max_streams) + ")"};
        }
    } while (!active_.compare_exchange_weak(current, current + 1));

    auto channel = std::make_shared<StreamChannel>(options_.max_pending_frames);
    {
        std::lock_guard lock(mutex_);
        open_.push_back(channel);
    }
    return std::make_shared<Lease>(*this, std::move(channel), std::move(job));
}

void ConnectionHub::release(const std::shared_ptr<StreamChannel>& channel) {
    {
        std::lock_guard lock(mutex_);
        open_.erase(std::remove(open_.begin(), open_.end(), channel), open_.end());
    }
    --active_;
}

void ConnectionHub::close_all() {
    std::vector<std::shared_ptr<StreamChannel>> channels;
    {
        std::lock_guard lock(mutex_);
        channels = open_;
    }
    for (auto& channel : channels) channel->close();
}

Result<HttpResponse> ConnectionHub::open_connection_stream() {
    auto lease = reserve(std::nullopt);
    if (!lease) return lease.error();

    logger_.debug("Connection stream opened (" + std::to_string(active_streams()) + " active)");
    return HttpResponse::stream([this, lease = std::move(*lease)](ChunkedStream& out) {
        auto hello = dump_json(nlohmann::json{{"type", "connected"}}) + "\n";
        if (!out.write(hello)) return;
        pump(lease->channel(), out, true);
    });
}

Result<HttpResponse> ConnectionHub::open_job_stream(const JobId& job) {
    auto lease = reserve(job);
    if (!lease) return lease.error();

    logger_.debug("Progress stream opened for " + job);
    return HttpResponse::stream([this, lease = std::move(*lease)](ChunkedStream& out) {
        auto hello = dump_json(nlohmann::json{
            {"type", "subscribed"}, {"training_id", *lease->job()}}) + "\n";
        if (!out.write(hello)) return;
        pump(lease->channel(), out, false);
    });
}

void ConnectionHub::pump(StreamChannel& channel, ChunkedStream& out, bool echo) {
    while (!out.stop_requested()) {
        if (auto line = channel.next(options_.poll_interval)) {
            if (!out.write(*line)) break;
            continue;
        }
        if (channel.is_closed()) break;

        // Nothing queued: look at the client side without blocking
        auto inbound = out.read_line(0);
        if (!inbound) {
            if (inbound.error().code != ErrorCode::Io) logger_.warn(inbound.error().message);
            break;
        }
        if (*inbound && echo) {
            auto frame = dump_json(nlohmann::json{{"type", "echo"}, {"data", **inbound}}) + "\n";
            if (!out.write(frame)) break;
        }
    }
}

}  // namespace archetype
