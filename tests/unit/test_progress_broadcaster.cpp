/**
 * @file test_progress_broadcaster.cpp
 * @brief Unit tests for ProgressBroadcaster fan-out and dead-channel removal.
 */

#include "training/progress_broadcaster.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace archetype;
using json = nlohmann::json;

namespace {

class RecordingChannel : public IProgressChannel {
public:
    Result<void> send(const json& frame) override {
        std::lock_guard lock(mutex_);
        frames_.push_back(frame);
        return {};
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return frames_.size();
    }

    json last() const {
        std::lock_guard lock(mutex_);
        return frames_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<json> frames_;
};

class ClosedChannel : public IProgressChannel {
public:
    Result<void> send(const json&) override {
        ++attempts;
        return Error{ErrorCode::Unavailable, "peer closed"};
    }
    int attempts = 0;
};

class ThrowingChannel : public IProgressChannel {
public:
    Result<void> send(const json&) override { throw std::runtime_error("broken pipe"); }
};

}  // namespace

class ProgressBroadcasterTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    ProgressBroadcaster broadcaster_{logger_};
};

TEST_F(ProgressBroadcasterTest, PublishReachesJobSubscribersOnly) {
    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe("job-a", a);
    broadcaster_.subscribe("job-b", b);

    EXPECT_EQ(broadcaster_.publish("job-a", {{"epoch", 1}}), 1u);
    EXPECT_EQ(a->count(), 1u);
    EXPECT_EQ(b->count(), 0u);
    EXPECT_EQ(a->last()["epoch"], 1);
}

TEST_F(ProgressBroadcasterTest, PublishWithoutSubscribersIsNoop) {
    EXPECT_EQ(broadcaster_.publish("nobody", {{"epoch", 1}}), 0u);
    EXPECT_EQ(broadcaster_.subscriber_count("nobody"), 0u);
}

TEST_F(ProgressBroadcasterTest, SubscribeIsIdempotent) {
    auto a = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe("job", a);
    broadcaster_.subscribe("job", a);
    broadcaster_.subscribe("job", nullptr);
    EXPECT_EQ(broadcaster_.subscriber_count("job"), 1u);
    broadcaster_.publish("job", json::object());
    EXPECT_EQ(a->count(), 1u);
}

TEST_F(ProgressBroadcasterTest, DeadChannelIsDroppedLiveOneKeepsReceiving) {
    auto dead = std::make_shared<ClosedChannel>();
    auto live = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe("job", dead);
    broadcaster_.subscribe("job", live);

    EXPECT_EQ(broadcaster_.publish("job", {{"epoch", 1}}), 1u);
    EXPECT_EQ(broadcaster_.subscriber_count("job"), 1u);
    EXPECT_EQ(broadcaster_.publish("job", {{"epoch", 2}}), 1u);

    EXPECT_EQ(dead->attempts, 1);
    EXPECT_EQ(live->count(), 2u);
}

TEST_F(ProgressBroadcasterTest, ThrowingChannelIsDropped) {
    auto bad = std::make_shared<ThrowingChannel>();
    auto live = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe("job", bad);
    broadcaster_.subscribe("job", live);
    EXPECT_EQ(broadcaster_.publish("job", json::object()), 1u);
    EXPECT_EQ(broadcaster_.subscriber_count("job"), 1u);
}

TEST_F(ProgressBroadcasterTest, UnsubscribeAndDropJob) {
    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe("job", a);
    broadcaster_.subscribe("job", b);

    broadcaster_.unsubscribe("job", a);
    EXPECT_EQ(broadcaster_.subscriber_count("job"), 1u);

    broadcaster_.drop_job("job");
    EXPECT_EQ(broadcaster_.subscriber_count("job"), 0u);
    EXPECT_EQ(broadcaster_.publish("job", json::object()), 0u);
    EXPECT_EQ(b->count(), 0u);
}

TEST_F(ProgressBroadcasterTest, BroadcastReachesConnections) {
    auto conn = std::make_shared<RecordingChannel>();
    auto dead = std::make_shared<ClosedChannel>();
    broadcaster_.subscribe_all(conn);
    broadcaster_.subscribe_all(dead);
    EXPECT_EQ(broadcaster_.connection_count(), 2u);

    EXPECT_EQ(broadcaster_.broadcast({{"type", "device_changed"}}), 1u);
    EXPECT_EQ(broadcaster_.connection_count(), 1u);
    EXPECT_EQ(conn->last()["type"], "device_changed");

    broadcaster_.unsubscribe_all(conn);
    EXPECT_EQ(broadcaster_.connection_count(), 0u);
}

TEST_F(ProgressBroadcasterTest, ConcurrentPublishers) {
    auto live = std::make_shared<RecordingChannel>();
    broadcaster_.subscribe("job", live);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 50; ++i) broadcaster_.publish("job", {{"i", i}});
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(live->count(), 200u);
}
