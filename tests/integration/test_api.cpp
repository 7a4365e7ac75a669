/**
 * @file test_api.cpp
 * @brief Integration tests driving the full service over a loopback socket.
 */

#include "app/app_context.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <thread>

using namespace archetype;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

struct Reply {
    int status = 0;
    std::string head;
    std::string body;

    [[nodiscard]] json as_json() const { return json::parse(body); }
};

/// One request per connection; the server closes after answering.
Reply send_request(uint16_t port, const std::string& method, const std::string& target,
                   const std::string& body = "") {
    Reply reply;
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return reply;

    timeval tv{5, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return reply;
    }

    std::string request = method + " " + target + " HTTP/1.1\r\n"
                        + "Host: 127.0.0.1\r\n"
                        + "Connection: close\r\n";
    if (!body.empty()) {
        request += "Content-Type: application/json\r\n";
        request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    request += "\r\n" + body;
    ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    std::string raw;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        raw.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);

    auto split = raw.find("\r\n\r\n");
    if (split == std::string::npos || raw.size() < 12) return reply;
    reply.head = raw.substr(0, split);
    reply.body = raw.substr(split + 4);
    reply.status = std::stoi(raw.substr(9, 3));
    return reply;
}

Device mock_cpu() {
    Device dev;
    dev.id = "cpu:0";
    dev.name = "Mock CPU";
    dev.vendor = Vendor::Intel;
    dev.backend = BackendKind::CpuFallback;
    dev.compute_units = 8;
    dev.total_memory_mb = 16384;
    dev.available_memory_mb = 8192;
    dev.performance_score = 100;
    return dev;
}

}  // namespace

// ═══════════════════════════════════════════════
// Service over loopback
// ═══════════════════════════════════════════════

class ApiIntegrationTest : public ::testing::Test {
protected:
    std::filesystem::path model_dir_ =
        std::filesystem::temp_directory_path() / "archetype_api_test";
    std::unique_ptr<AppContext> app_;
    uint16_t port_ = 0;

    void SetUp() override {
        std::filesystem::remove_all(model_dir_);

        Config config = default_config();
        config.server.port = 0;
        config.server.worker_threads = 4;
        config.server.max_streams = 4;
        config.devices.preference = "auto";
        config.storage.model_dir = model_dir_;
        config.training.default_epochs = 3;
        config.training.default_batch_size = 10;
        config.training.epoch_yield_ms = 1;
        config.benchmark.matrix_size = 16;
        config.benchmark.iterations = 2;

        AppContext::Options opts;
        opts.config = std::move(config);
        opts.log_sink = std::make_unique<NullSink>();
        opts.telemetry_sink = std::make_unique<NullSink>();
        opts.probes = make_mock_probes();
        opts.cpu_probe = std::make_unique<MockProbe>(BackendKind::CpuFallback,
                                                     std::vector<Device>{mock_cpu()});
        opts.store = std::make_unique<InMemoryMetadataStore>();

        app_ = std::make_unique<AppContext>(std::move(opts));
        auto port = app_->start();
        ASSERT_TRUE(port.has_value()) << port.error().message;
        port_ = *port;
    }

    void TearDown() override {
        if (app_) app_->stop();
        app_.reset();
        std::filesystem::remove_all(model_dir_);
    }

    Reply get(const std::string& target) { return send_request(port_, "GET", target); }
    Reply post(const std::string& target, const json& body = json::object()) {
        return send_request(port_, "POST", target, body.dump());
    }

    std::string create_mlp(const std::string& name = "tiny") {
        auto reply = post("/api/v1/models", {{"name", name}, {"model_type", "mlp"},
                                             {"architecture", {{"layers", {4, 8, 3}}}}});
        EXPECT_EQ(reply.status, 200) << reply.body;
        if (reply.status != 200) return {};
        return reply.as_json()["id"].get<std::string>();
    }

    /// Poll the status endpoint until the job leaves its live states.
    json wait_until_done(const std::string& job_id) {
        json status;
        auto deadline = std::chrono::steady_clock::now() + 10s;
        while (std::chrono::steady_clock::now() < deadline) {
            status = get("/api/v1/training/" + job_id).as_json();
            auto state = status["status"].get<std::string>();
            if (state == "completed" || state == "failed" || state == "cancelled") break;
            std::this_thread::sleep_for(20ms);
        }
        return status;
    }
};

TEST_F(ApiIntegrationTest, RootAndHealth) {
    auto root = get("/");
    ASSERT_EQ(root.status, 200);
    EXPECT_EQ(root.as_json()["name"], "archetype");
    EXPECT_NE(root.head.find("application/json"), std::string::npos);

    auto health = get("/api/v1/health");
    ASSERT_EQ(health.status, 200);
    auto j = health.as_json();
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_TRUE(j["gpu_available"].get<bool>());
    EXPECT_EQ(j["gpu_count"], 2);

    auto detailed = get("/api/v1/health/detailed").as_json();
    EXPECT_EQ(detailed["components"]["device_manager"]["device_count"], 3);
    EXPECT_EQ(detailed["components"]["plugin_manager"]["loaded_plugins"], 3);
}

TEST_F(ApiIntegrationTest, DevicesAndPreference) {
    auto devices = get("/api/v1/devices");
    ASSERT_EQ(devices.status, 200);
    auto j = devices.as_json();
    EXPECT_EQ(j["total_devices"], 3);
    EXPECT_EQ(j["current_device"], "cuda:0");

    auto cpu = post("/api/v1/devices/preference", {{"preference", "cpu_only"}});
    ASSERT_EQ(cpu.status, 200) << cpu.body;
    EXPECT_EQ(cpu.as_json()["device_id"], "cpu:0");

    auto current = get("/api/v1/devices/current");
    ASSERT_EQ(current.status, 200);
    EXPECT_EQ(current.as_json()["id"], "cpu:0");

    auto bogus = post("/api/v1/devices/preference", {{"preference", "quantum"}});
    EXPECT_EQ(bogus.status, 400);

    auto missing = get("/api/v1/devices/opencl:9");
    EXPECT_EQ(missing.status, 404);

    auto select = post("/api/v1/devices/drm:1/select");
    ASSERT_EQ(select.status, 200);
    EXPECT_EQ(select.as_json()["device_id"], "drm:1");
}

TEST_F(ApiIntegrationTest, BenchmarkRespectsLimits) {
    auto bench = get("/api/v1/devices/benchmark?matrix_size=8&iterations=1");
    ASSERT_EQ(bench.status, 200) << bench.body;

    auto too_big = get("/api/v1/devices/benchmark?matrix_size=10000");
    EXPECT_EQ(too_big.status, 400);

    auto not_a_number = get("/api/v1/devices/benchmark?iterations=many");
    EXPECT_EQ(not_a_number.status, 400);
}

TEST_F(ApiIntegrationTest, PluginsCanBeDisabled) {
    auto plugins = get("/api/v1/plugins").as_json();
    EXPECT_EQ(plugins["total"], 3);

    ASSERT_EQ(post("/api/v1/plugins/cnn_core/disable").status, 200);
    auto cnn = post("/api/v1/models", {{"name", "c"}, {"model_type", "cnn"}});
    EXPECT_EQ(cnn.status, 400);

    ASSERT_EQ(post("/api/v1/plugins/cnn_core/enable").status, 200);
    EXPECT_EQ(get("/api/v1/plugins/nope").status, 404);
}

TEST_F(ApiIntegrationTest, ModelLifecycle) {
    auto id = create_mlp();
    ASSERT_FALSE(id.empty());

    auto fetched = get("/api/v1/models/" + id);
    ASSERT_EQ(fetched.status, 200);
    EXPECT_EQ(fetched.as_json()["name"], "tiny");

    auto listed = get("/api/v1/models?skip=0&limit=10").as_json();
    EXPECT_EQ(listed["total"], 1);
    ASSERT_EQ(listed["models"].size(), 1u);

    auto updated = send_request(port_, "PUT", "/api/v1/models/" + id,
                                json{{"name", "renamed"}}.dump());
    ASSERT_EQ(updated.status, 200) << updated.body;
    EXPECT_EQ(updated.as_json()["model"]["name"], "renamed");

    auto exported = post("/api/v1/models/" + id + "/export?format=json");
    ASSERT_EQ(exported.status, 200) << exported.body;
    EXPECT_TRUE(std::filesystem::exists(exported.as_json()["export_path"].get<std::string>()));

    EXPECT_EQ(post("/api/v1/models/" + id + "/export", {{"format", "onnx"}}).status, 400);

    auto removed = send_request(port_, "DELETE", "/api/v1/models/" + id);
    ASSERT_EQ(removed.status, 200);
    EXPECT_EQ(get("/api/v1/models/" + id).status, 404);
}

TEST_F(ApiIntegrationTest, ModelRequestValidation) {
    EXPECT_EQ(post("/api/v1/models", {{"model_type", "mlp"}}).status, 400);
    EXPECT_EQ(post("/api/v1/models", {{"name", "x"}, {"model_type", "gan"}}).status, 400);
    EXPECT_EQ(send_request(port_, "POST", "/api/v1/models", "{not json").status, 400);
}

TEST_F(ApiIntegrationTest, TrainingRunsToCompletion) {
    auto model_id = create_mlp();
    ASSERT_FALSE(model_id.empty());

    auto started = post("/api/v1/training/start",
                        {{"model_id", model_id},
                         {"dataset_config", {{"num_samples", 60}}},
                         {"training_config", {{"epochs", 3}, {"batch_size", 10}}},
                         {"validation_config", {{"num_samples", 20}}}});
    ASSERT_EQ(started.status, 200) << started.body;
    auto job_id = started.as_json()["training_id"].get<std::string>();

    auto status = wait_until_done(job_id);
    EXPECT_EQ(status["status"], "completed");
    EXPECT_EQ(status["current_epoch"], 3);
    EXPECT_EQ(status["history"].size(), 3u);

    auto metrics = get("/api/v1/training/" + job_id + "/metrics");
    ASSERT_EQ(metrics.status, 200);
    EXPECT_DOUBLE_EQ(metrics.as_json()["progress"].get<double>(), 1.0);

    auto completed = get("/api/v1/training?status=completed").as_json();
    EXPECT_EQ(completed["total"], 1);
    EXPECT_FALSE(completed["trainings"][0].contains("history"));
    EXPECT_EQ(get("/api/v1/training?status=sleeping").status, 400);

    ASSERT_EQ(send_request(port_, "DELETE", "/api/v1/training/" + job_id).status, 200);
    EXPECT_EQ(get("/api/v1/training/" + job_id).status, 404);
}

TEST_F(ApiIntegrationTest, TrainingCanBeStopped) {
    auto model_id = create_mlp();
    ASSERT_FALSE(model_id.empty());

    auto started = post("/api/v1/training/start",
                        {{"model_id", model_id},
                         {"training_config", {{"epochs", 100000}, {"batch_size", 10}}},
                         {"dataset_config", {{"num_samples", 20}}}});
    ASSERT_EQ(started.status, 200) << started.body;
    auto job_id = started.as_json()["training_id"].get<std::string>();

    // A running job still holds its model
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(send_request(port_, "DELETE", "/api/v1/models/" + model_id).status, 409);

    ASSERT_EQ(post("/api/v1/training/" + job_id + "/stop").status, 200);
    auto status = wait_until_done(job_id);
    EXPECT_EQ(status["status"], "cancelled");

    EXPECT_EQ(post("/api/v1/training/unknown/stop").status, 404);
}

TEST_F(ApiIntegrationTest, TrainingOfUnknownModelIsNotFound) {
    auto started = post("/api/v1/training/start", {{"model_id", "no-such-model"}});
    EXPECT_EQ(started.status, 404);
}

TEST_F(ApiIntegrationTest, UnknownRouteAndWrongMethod) {
    auto missing = get("/api/v1/nothing-here");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.as_json()["error"], "NotFound");

    auto wrong = send_request(port_, "DELETE", "/api/v1/devices");
    EXPECT_EQ(wrong.status, 405);
}

TEST_F(ApiIntegrationTest, EventStreamAnnouncesConnection) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    timeval tv{5, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

    std::string request = "GET /ws HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";
    ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    std::string received;
    char buf[1024];
    while (received.find("\"connected\"") == std::string::npos) {
        auto n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        received.append(buf, static_cast<size_t>(n));
    }
    EXPECT_NE(received.find("Transfer-Encoding: chunked"), std::string::npos);
    EXPECT_NE(received.find("\"connected\""), std::string::npos);
    ::close(fd);
}
