/**
 * @file trainable_unit.cpp
 * @brief TrainableUnit training steps and export writers.
 */

#include "model/trainable_unit.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace archetype {

// ─────────────────────────────────────────────
// UnitMetadata JSON
// ─────────────────────────────────────────────

namespace {

Timestamp parse_iso8601(const std::string& text) {
    std::tm tm{};
    int millis = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis) < 6) {
        return std::chrono::system_clock::now();
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    auto secs = timegm(&tm);
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

}  // anonymous namespace

void to_json(nlohmann::json& j, const UnitMetadata& meta) {
    j = nlohmann::json{
        {"id", meta.id},
        {"name", meta.name},
        {"model_type", to_string(meta.type)},
        {"architecture", meta.architecture},
        {"hyperparameters", meta.hyperparameters},
        {"parameter_count", meta.parameter_count},
        {"created_at", format_iso8601(meta.created_at)},
        {"updated_at", format_iso8601(meta.updated_at)},
        {"status", meta.status},
        {"device_id", meta.device_id}
    };
}

void from_json(const nlohmann::json& j, UnitMetadata& meta) {
    meta.id = j.at("id").get<std::string>();
    meta.name = j.value("name", std::string{});
    auto type = parse_unit_type(j.at("model_type").get<std::string>());
    if (!type) {
        throw std::invalid_argument("unknown model_type " + j.at("model_type").get<std::string>());
    }
    meta.type = *type;
    meta.architecture = j.value("architecture", nlohmann::json::object());
    meta.hyperparameters = j.value("hyperparameters", nlohmann::json::object());
    meta.parameter_count = j.value("parameter_count", uint64_t{0});
    meta.created_at = parse_iso8601(j.value("created_at", std::string{}));
    meta.updated_at = j.contains("updated_at")
        ? parse_iso8601(j.at("updated_at").get<std::string>()) : meta.created_at;
    meta.status = j.value("status", std::string{"created"});
    meta.device_id = j.value("device_id", std::string{});
}

// ─────────────────────────────────────────────
// TrainableUnit
// ─────────────────────────────────────────────

TrainableUnit::TrainableUnit(UnitType type, Shape sample_shape, size_t num_outputs,
                             DeviceId device, uint32_t seed)
    : type_(type)
    , sample_shape_(std::move(sample_shape))
    , num_outputs_(num_outputs)
    , device_id_(std::move(device))
    , rng_(std::make_unique<std::mt19937>(seed)) {}

size_t TrainableUnit::parameter_count() {
    std::lock_guard lock(mutex_);
    return network_.parameter_count();
}

Shape TrainableUnit::batch_shape(size_t batch) const {
    Shape shape{batch};
    shape.insert(shape.end(), sample_shape_.begin(), sample_shape_.end());
    return shape;
}

StepResult TrainableUnit::train_step(const Tensor& inputs, const std::vector<uint32_t>& labels,
                                     Optimizer& optimizer, LossKind loss) {
    std::lock_guard lock(mutex_);
    network_.zero_grad();
    Tensor logits = network_.forward(inputs, true);
    auto out = compute_loss(loss, logits, labels);
    network_.backward(out.grad);
    optimizer.step(network_.parameters());
    return StepResult{out.loss, out.correct};
}

StepResult TrainableUnit::evaluate(const Tensor& inputs, const std::vector<uint32_t>& labels,
                                   LossKind loss) {
    std::lock_guard lock(mutex_);
    Tensor logits = network_.forward(inputs, false);
    auto out = compute_loss(loss, logits, labels);
    return StepResult{out.loss, out.correct};
}

Tensor TrainableUnit::predict(const Tensor& inputs) {
    std::lock_guard lock(mutex_);
    return network_.forward(inputs, false);
}

Shape TrainableUnit::traced_output_shape() {
    // Export traces a zero batch of one sample through the network
    Tensor dummy(batch_shape(1));
    return network_.forward(dummy, false).shape();
}

namespace {

constexpr char kNativeMagic[8] = {'A', 'R', 'C', 'H', 'U', 'N', 'I', 'T'};
constexpr uint32_t kNativeVersion = 1;

void write_u32(std::ofstream& os, uint32_t v) {
    os.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

void write_floats(std::ofstream& os, const std::vector<float>& values) {
    os.write(reinterpret_cast<const char*>(values.data()),
             static_cast<std::streamsize>(values.size() * sizeof(float)));
}

nlohmann::json shape_json(const Shape& shape) {
    auto arr = nlohmann::json::array();
    for (auto d : shape) arr.push_back(d);
    return arr;
}

}  // anonymous namespace

Result<void> TrainableUnit::save_native(const std::filesystem::path& path, const UnitMetadata& meta) {
    std::lock_guard lock(mutex_);
    try {
        nlohmann::json header = meta;
        header["input_shape"] = shape_json(batch_shape(1));
        header["output_shape"] = shape_json(traced_output_shape());
        auto header_text = header.dump();

        std::ofstream os(path, std::ios::binary | std::ios::trunc);
        if (!os) return Error{ErrorCode::Io, "Cannot open " + path.string() + " for writing"};

        os.write(kNativeMagic, sizeof(kNativeMagic));
        write_u32(os, kNativeVersion);
        write_u32(os, static_cast<uint32_t>(header_text.size()));
        os.write(header_text.data(), static_cast<std::streamsize>(header_text.size()));

        auto params = network_.parameters();
        write_u32(os, static_cast<uint32_t>(params.size()));
        for (const auto* p : params) {
            write_u32(os, static_cast<uint32_t>(p->name.size()));
            os.write(p->name.data(), static_cast<std::streamsize>(p->name.size()));
            write_u32(os, static_cast<uint32_t>(p->value.rank()));
            for (auto d : p->value.shape()) write_u32(os, static_cast<uint32_t>(d));
            write_floats(os, p->value.values());
        }
        if (!os) return Error{ErrorCode::Io, "Write failed for " + path.string()};
        return {};
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, std::string{"Native export failed: "} + e.what()};
    }
}

Result<void> TrainableUnit::save_interchange(const std::filesystem::path& path,
                                             const UnitMetadata& meta) {
    std::lock_guard lock(mutex_);
    try {
        nlohmann::json doc;
        doc["format"] = "archetype-interchange";
        doc["version"] = 1;
        doc["unit"] = meta;
        doc["input_shape"] = shape_json(batch_shape(1));
        doc["output_shape"] = shape_json(traced_output_shape());

        auto layers = nlohmann::json::array();
        size_t index = 0;
        for (const auto& layer : network_.layers()) {
            nlohmann::json desc;
            layer->describe(desc);
            auto params = nlohmann::json::object();
            for (const auto* p : layer->parameters()) {
                params[p->name] = {{"shape", shape_json(p->value.shape())},
                                   {"data", p->value.values()}};
            }
            desc["index"] = index++;
            desc["parameters"] = std::move(params);
            layers.push_back(std::move(desc));
        }
        doc["layers"] = std::move(layers);

        std::ofstream os(path, std::ios::trunc);
        if (!os) return Error{ErrorCode::Io, "Cannot open " + path.string() + " for writing"};
        os << doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!os) return Error{ErrorCode::Io, "Write failed for " + path.string()};
        return {};
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, std::string{"Interchange export failed: "} + e.what()};
    }
}

}  // namespace archetype
