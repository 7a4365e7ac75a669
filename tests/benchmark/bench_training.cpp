/**
 * @file bench_training.cpp
 * @brief Performance benchmarks for the numeric engine, training steps and serving paths.
 *
 * Measures device discovery and selection, kernel cost, per-batch training
 * cost for each builder, progress fan-out and request dispatch overhead.
 *
 * Usage: ./bench_training [--csv]
 */

#include "core/types.hpp"
#include "device/device.hpp"
#include "device/device_catalog.hpp"
#include "device/device_selector.hpp"
#include "device/probe.hpp"
#include "engine/numeric_engine.hpp"
#include "engine/optimizer.hpp"
#include "executor/thread_pool.hpp"
#include "model/model_builder.hpp"
#include "server/http_message.hpp"
#include "server/router.hpp"
#include "telemetry/json_sink.hpp"
#include "training/dataset.hpp"
#include "training/progress_broadcaster.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace archetype;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    for (size_t i = 0; i < std::min(iterations / 10, size_t{3}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(36) << "Benchmark"
                      << std::right << std::setw(12) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(12) << "P99(us)"
                      << std::setw(12) << "Min(us)"
                      << "  Info\n"
                      << std::string(96, '-') << "\n";
        }
        std::cout << std::left << std::setw(36) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(12) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(12) << r.p99_us
                  << std::setw(12) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Device bench_cpu() {
    Device dev;
    dev.id = "cpu:0";
    dev.name = "Benchmark CPU";
    dev.backend = BackendKind::CpuFallback;
    dev.compute_units = std::thread::hardware_concurrency();
    return dev;
}

class CountingChannel : public IProgressChannel {
public:
    Result<void> send(const nlohmann::json&) override {
        ++frames;
        return {};
    }
    size_t frames = 0;
};

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_devices() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;
    Logger logger(std::make_unique<NullSink>());
    CpuReferenceEngine engine;

    DeviceCatalog catalog(logger, std::make_unique<MockProbe>(BackendKind::CpuFallback,
                                                              std::vector<Device>{bench_cpu()}));
    for (auto& probe : make_mock_probes()) catalog.register_probe(std::move(probe));
    DeviceSelector selector(catalog, engine, logger);

    R.push_back(run_bench("catalog_discover", "Devices", N,
        [&]{ auto d = catalog.discover(); (void)d; }, "3 mock probes"));
    R.push_back(run_bench("auto_select", "Devices", N,
        [&]{ auto d = selector.auto_select(); (void)d; }));
    R.push_back(run_bench("apply_preference(cpu_only)", "Devices", N,
        [&]{ auto d = selector.apply_preference(DevicePreference::CpuOnly); (void)d; }));

    auto devices = catalog.list_all();
    R.push_back(run_bench("pick_best(3)", "Devices", N * 4,
        [&]{ auto d = pick_best(devices); (void)d; }));

    return R;
}

std::vector<BenchResult> bench_engine() {
    std::vector<BenchResult> R;
    CpuReferenceEngine engine;
    std::mt19937 rng(7);

    for (size_t n : {32, 64, 128, 256}) {
        auto a = Tensor::randn({n, n}, 1.0f, rng);
        auto b = Tensor::randn({n, n}, 1.0f, rng);
        size_t iters = n >= 256 ? 20 : 200;
        double gflop = 2.0 * static_cast<double>(n * n * n) / 1e9;
        R.push_back(run_bench("matmul(" + std::to_string(n) + ")", "Engine", iters,
            [&]{ auto c = engine.matmul(a, b); (void)c; },
            std::to_string(gflop).substr(0, 6) + " GFLOP"));
    }

    auto a = Tensor::randn({128, 256}, 1.0f, rng);
    auto b = Tensor::randn({128, 64}, 1.0f, rng);
    R.push_back(run_bench("matmul_transposed_a", "Engine", 200,
        [&]{ auto c = engine.matmul(a, b, true, false); (void)c; }, "[256x128]x[128x64]"));

    auto input = Tensor::randn({8, 3, 32, 32}, 1.0f, rng);
    auto weight = Tensor::randn({16, 3, 3, 3}, 0.1f, rng);
    Tensor bias(Shape{16});
    R.push_back(run_bench("conv2d(3->16, 32x32, N=8)", "Engine", 50,
        [&]{ auto y = engine.conv2d(input, weight, bias, 1); (void)y; }));

    auto y = engine.conv2d(input, weight, bias, 1);
    R.push_back(run_bench("conv2d_backward(3->16)", "Engine", 20,
        [&]{ auto g = engine.conv2d_backward(input, weight, y, 1); (void)g; }));

    return R;
}

std::vector<BenchResult> bench_training() {
    std::vector<BenchResult> R;
    CpuReferenceEngine engine;
    ModelBuilderRegistry builders;
    auto device = bench_cpu();
    engine.bind(device);

    struct Case {
        UnitType type;
        nlohmann::json architecture;
        size_t iterations;
    };
    const std::vector<Case> cases = {
        {UnitType::Mlp, nlohmann::json::object(), 50},
        {UnitType::Rnn, nlohmann::json::object(), 10},
        {UnitType::Cnn, {{"conv_layers", nlohmann::json::array({8})},
                         {"kernel_sizes", nlohmann::json::array({3})},
                         {"fc_layers", nlohmann::json::array({32})}}, 10},
    };

    for (const auto& c : cases) {
        auto built = builders.build(c.type, c.architecture, nlohmann::json::object(),
                                    engine, device, 42);
        if (!built) {
            std::cerr << "skipping " << to_string(c.type) << ": " << built.error().message << "\n";
            continue;
        }
        auto& unit = *built->unit;
        SyntheticDataset data(unit.sample_shape(), unit.num_outputs(), 32, 1);
        auto batch = data.batch(0, 32);
        Optimizer optimizer(OptimizerOptions{.kind = OptimizerKind::Adam, .learning_rate = 0.001f});

        auto label = std::to_string(unit.parameter_count()) + " params, N=32";
        auto name = std::string{to_string(c.type)};
        R.push_back(run_bench(name + "_train_step", "Training", c.iterations,
            [&]{ auto s = unit.train_step(batch.inputs, batch.labels, optimizer,
                                          LossKind::CrossEntropy); (void)s; }, label));
        R.push_back(run_bench(name + "_evaluate", "Training", c.iterations,
            [&]{ auto s = unit.evaluate(batch.inputs, batch.labels, LossKind::CrossEntropy); (void)s; },
            label));
    }

    SyntheticDataset data({784}, 10, 1000, 3);
    std::mt19937 rng(5);
    R.push_back(run_bench("dataset_shuffle(1000)", "Training", 100,
        [&]{ data.shuffle(rng); }, "784 features"));
    R.push_back(run_bench("dataset_batch(32)", "Training", 500,
        [&]{ auto b = data.batch(3, 32); (void)b; }));

    return R;
}

std::vector<BenchResult> bench_broadcast() {
    std::vector<BenchResult> R;
    Logger logger(std::make_unique<NullSink>());
    nlohmann::json frame{{"type", "training_progress"}, {"training_id", "job-0"},
                         {"data", {{"current_epoch", 1}, {"loss", 0.5}}}};

    for (size_t subs : {1, 10, 100}) {
        ProgressBroadcaster broadcaster(logger);
        for (size_t i = 0; i < subs; ++i) {
            broadcaster.subscribe("job-0", std::make_shared<CountingChannel>());
        }
        R.push_back(run_bench("publish(" + std::to_string(subs) + ")", "Broadcast", 1000,
            [&]{ auto n = broadcaster.publish("job-0", frame); (void)n; },
            std::to_string(subs) + " subscribers"));
    }

    R.push_back(run_bench("frame_dump", "Broadcast", 1000,
        [&]{ auto s = dump_json(frame); (void)s; }));

    return R;
}

std::vector<BenchResult> bench_serving() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    const std::string head =
        "POST /api/v1/models/abc/export?format=json HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n";
    R.push_back(run_bench("parse_request_head", "Serving", N,
        [&]{ auto r = parse_request_head(head); (void)r; }));

    Router router;
    auto noop = [](const HttpRequest&, const PathParams&) { return HttpResponse::json(200, {}); };
    for (const char* pattern : {"/api/v1/health", "/api/v1/devices", "/api/v1/devices/{id}",
                                "/api/v1/models", "/api/v1/models/{id}", "/api/v1/models/{id}/export",
                                "/api/v1/training", "/api/v1/training/{id}",
                                "/api/v1/training/{id}/metrics"}) {
        router.add("GET", pattern, noop);
    }
    auto request = parse_request_head("GET /api/v1/training/job-1/metrics HTTP/1.1\r\n\r\n");
    if (request) {
        R.push_back(run_bench("router_dispatch", "Serving", N,
            [&]{ auto r = router.dispatch(*request); (void)r; }, "9 routes"));
    }

    ThreadPool pool(4);
    R.push_back(run_bench("threadpool_submit", "Serving", 500, [&]{
        std::promise<void> p; auto f = p.get_future();
        pool.submit([&p]{ p.set_value(); }); f.wait();
    }));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  Archetype Performance Benchmarks\n"
                  << "  " << std::string(34, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_devices());
    append(bench_engine());
    append(bench_training());
    append(bench_broadcast());
    append(bench_serving());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
