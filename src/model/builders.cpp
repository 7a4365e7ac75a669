/**
 * @file builders.cpp
 * @brief MLP, RNN and CNN builders plus the builder registry.
 */

#include "model/model_builder.hpp"

#include <algorithm>
#include <stdexcept>

namespace archetype {

void to_json(nlohmann::json& j, const BuilderManifest& manifest) {
    j = nlohmann::json{
        {"id", manifest.id},
        {"name", manifest.name},
        {"version", manifest.version},
        {"description", manifest.description},
        {"author", "archetype"},
        {"plugin_type", "model_builder"},
        {"model_type", to_string(manifest.unit_type)},
        {"loaded", true},
        {"enabled", manifest.enabled},
        {"dependencies", nlohmann::json::array()},
        {"manifest", {
            {"component_types", manifest.component_types},
            {"parameters", manifest.parameters}
        }}
    };
}

namespace {

/// Thrown for malformed architecture bags; converted to InvalidArgument by build().
struct BadArchitecture : std::runtime_error {
    using std::runtime_error::runtime_error;
};

size_t positive(const nlohmann::json& bag, const char* key, size_t fallback) {
    if (!bag.contains(key)) return fallback;
    const auto& v = bag.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
        throw BadArchitecture(std::string{key} + " must be a positive integer");
    }
    return v.get<size_t>();
}

std::vector<size_t> positive_list(const nlohmann::json& bag, const char* key,
                                  std::vector<size_t> fallback) {
    if (!bag.contains(key)) return fallback;
    const auto& v = bag.at(key);
    if (!v.is_array()) throw BadArchitecture(std::string{key} + " must be a list of integers");
    std::vector<size_t> out;
    for (const auto& item : v) {
        if (!item.is_number_integer() || item.get<int64_t>() <= 0) {
            throw BadArchitecture(std::string{key} + " must contain positive integers");
        }
        out.push_back(item.get<size_t>());
    }
    return out;
}

float probability(const nlohmann::json& bag, const char* key, float fallback) {
    if (!bag.contains(key)) return fallback;
    const auto& v = bag.at(key);
    if (!v.is_number()) throw BadArchitecture(std::string{key} + " must be a number");
    auto p = v.get<float>();
    if (p < 0.0f || p >= 1.0f) throw BadArchitecture(std::string{key} + " must be in [0, 1)");
    return p;
}

ActivationKind activation(const nlohmann::json& hyper) {
    auto name = hyper.value("activation", std::string{"relu"});
    auto kind = parse_activation(name);
    if (!kind) throw BadArchitecture("Unknown activation: " + name);
    return *kind;
}

template <typename F>
Result<BuiltUnit> guarded_build(F&& func) {
    try {
        return func();
    } catch (const BadArchitecture& e) {
        return Error{ErrorCode::InvalidArgument, e.what()};
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string{"Malformed architecture: "} + e.what()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::Internal, std::string{"Model construction failed: "} + e.what()};
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// MLP
// ─────────────────────────────────────────────

BuilderManifest MlpBuilder::manifest() const {
    return BuilderManifest{
        .id = "mlp_core",
        .name = "MLP Core Plugin",
        .version = "1.0.0",
        .description = "Multi-Layer Perceptron neural network implementation",
        .unit_type = UnitType::Mlp,
        .component_types = {"mlp_layer", "dense_layer", "linear_layer"},
        .parameters = {
            {"layers", {784, 128, 64, 10}},
            {"activation", "relu"},
            {"dropout", 0.0}
        },
        .enabled = true
    };
}

Result<BuiltUnit> MlpBuilder::build(const nlohmann::json& architecture,
                                    const nlohmann::json& hyperparameters,
                                    INumericEngine& engine, const Device& device, uint32_t seed) {
    return guarded_build([&]() -> Result<BuiltUnit> {
        auto sizes = positive_list(architecture, "layers", {784, 128, 64, 10});
        if (sizes.size() < 2) throw BadArchitecture("layers needs at least input and output sizes");
        auto act = activation(hyperparameters);
        float dropout = probability(hyperparameters, "dropout", 0.0f);

        auto unit = std::make_shared<TrainableUnit>(UnitType::Mlp, Shape{sizes.front()},
                                                    sizes.back(), device.id, seed);
        auto& net = unit->network();
        for (size_t i = 0; i + 1 < sizes.size(); ++i) {
            net.add(std::make_unique<Dense>(engine, sizes[i], sizes[i + 1], unit->rng()));
            if (i + 2 < sizes.size()) {
                net.add(std::make_unique<Activation>(act));
                if (dropout > 0.0f) net.add(std::make_unique<Dropout>(dropout, unit->rng()));
            }
        }

        nlohmann::json resolved = architecture.is_object() ? architecture : nlohmann::json::object();
        resolved["layers"] = sizes;
        return BuiltUnit{std::move(unit), std::move(resolved)};
    });
}

// ─────────────────────────────────────────────
// RNN
// ─────────────────────────────────────────────

BuilderManifest RnnBuilder::manifest() const {
    return BuilderManifest{
        .id = "rnn_core",
        .name = "RNN Core Plugin",
        .version = "1.0.0",
        .description = "Recurrent neural network implementation (LSTM, GRU, RNN)",
        .unit_type = UnitType::Rnn,
        .component_types = {"lstm_layer", "gru_layer", "rnn_layer"},
        .parameters = {
            {"input_size", 100},
            {"hidden_size", 128},
            {"num_layers", 2},
            {"output_size", 10},
            {"sequence_length", 10},
            {"bidirectional", false},
            {"rnn_type", "LSTM"}
        },
        .enabled = true
    };
}

Result<BuiltUnit> RnnBuilder::build(const nlohmann::json& architecture,
                                    const nlohmann::json& hyperparameters,
                                    INumericEngine& engine, const Device& device, uint32_t seed) {
    auto rnn_type = architecture.is_object()
        ? architecture.value("rnn_type", std::string{"LSTM"}) : std::string{"LSTM"};
    auto cell = parse_cell_type(rnn_type);
    if (!cell) {
        return Error{ErrorCode::UnsupportedType,
                     "rnn_type " + rnn_type + " is not supported; expected LSTM, GRU or RNN"};
    }

    return guarded_build([&]() -> Result<BuiltUnit> {
        size_t input_size = positive(architecture, "input_size", 100);
        size_t hidden_size = positive(architecture, "hidden_size", 128);
        size_t num_layers = positive(architecture, "num_layers", 2);
        size_t output_size = positive(architecture, "output_size", 10);
        size_t seq_len = positive(architecture, "sequence_length", 10);
        bool bidirectional = architecture.value("bidirectional", false);
        float dropout = probability(hyperparameters, "dropout", 0.0f);

        auto unit = std::make_shared<TrainableUnit>(UnitType::Rnn, Shape{seq_len, input_size},
                                                    output_size, device.id, seed);
        auto& net = unit->network();
        const size_t directions = bidirectional ? 2 : 1;
        size_t in = input_size;
        for (size_t layer = 0; layer < num_layers; ++layer) {
            net.add(std::make_unique<Recurrent>(engine, *cell, in, hidden_size, bidirectional,
                                                unit->rng()));
            // dropout applies between stacked layers, not after the last one
            if (dropout > 0.0f && layer + 1 < num_layers) {
                net.add(std::make_unique<Dropout>(dropout, unit->rng()));
            }
            in = hidden_size * directions;
        }
        net.add(std::make_unique<LastStep>());
        net.add(std::make_unique<Dense>(engine, in, output_size, unit->rng()));

        nlohmann::json resolved = architecture.is_object() ? architecture : nlohmann::json::object();
        resolved["input_size"] = input_size;
        resolved["hidden_size"] = hidden_size;
        resolved["num_layers"] = num_layers;
        resolved["output_size"] = output_size;
        resolved["sequence_length"] = seq_len;
        resolved["bidirectional"] = bidirectional;
        resolved["rnn_type"] = rnn_type;
        return BuiltUnit{std::move(unit), std::move(resolved)};
    });
}

// ─────────────────────────────────────────────
// CNN
// ─────────────────────────────────────────────

namespace {

constexpr size_t kCnnInputSize = 32;

}  // anonymous namespace

BuilderManifest CnnBuilder::manifest() const {
    return BuilderManifest{
        .id = "cnn_core",
        .name = "CNN Core Plugin",
        .version = "1.0.0",
        .description = "Convolutional neural network implementation for 32x32 images",
        .unit_type = UnitType::Cnn,
        .component_types = {"conv_layer", "pooling_layer", "conv2d_layer"},
        .parameters = {
            {"input_channels", 3},
            {"num_classes", 10},
            {"conv_layers", {32, 64, 128}},
            {"kernel_sizes", {3, 3, 3}},
            {"fc_layers", {512, 256}},
            {"pooling", "max"},
            {"dropout", 0.5}
        },
        .enabled = true
    };
}

Result<BuiltUnit> CnnBuilder::build(const nlohmann::json& architecture,
                                    const nlohmann::json& hyperparameters,
                                    INumericEngine& engine, const Device& device, uint32_t seed) {
    return guarded_build([&]() -> Result<BuiltUnit> {
        size_t channels = positive(architecture, "input_channels", 3);
        size_t num_classes = positive(architecture, "num_classes", 10);
        auto conv = positive_list(architecture, "conv_layers", {32, 64, 128});
        auto kernels = positive_list(architecture, "kernel_sizes", {3, 3, 3});
        auto fc = positive_list(architecture, "fc_layers", {512, 256});
        auto pooling_name = architecture.value("pooling", std::string{"max"});
        float dropout = probability(hyperparameters, "dropout",
                                    probability(architecture, "dropout", 0.5f));

        if (kernels.size() < conv.size()) {
            throw BadArchitecture("kernel_sizes needs one entry per conv layer");
        }
        PoolKind pooling;
        if (pooling_name == "max") pooling = PoolKind::Max;
        else if (pooling_name == "avg") pooling = PoolKind::Avg;
        else throw BadArchitecture("pooling must be max or avg");

        auto unit = std::make_shared<TrainableUnit>(
            UnitType::Cnn, Shape{channels, kCnnInputSize, kCnnInputSize}, num_classes, device.id, seed);
        auto& net = unit->network();

        size_t in_channels = channels;
        size_t spatial = kCnnInputSize;
        for (size_t i = 0; i < conv.size(); ++i) {
            if (spatial + 2 < kernels[i]) throw BadArchitecture("kernel larger than feature map");
            net.add(std::make_unique<Conv2d>(engine, in_channels, conv[i], kernels[i], 1, unit->rng()));
            net.add(std::make_unique<Activation>(ActivationKind::Relu));
            net.add(std::make_unique<Pool2d>(pooling));
            spatial = (spatial + 2 - kernels[i] + 1) / 2;
            if (spatial == 0) throw BadArchitecture("too many conv layers for a 32x32 input");
            in_channels = conv[i];
        }
        net.add(std::make_unique<Flatten>());

        size_t in_features = in_channels * spatial * spatial;
        for (size_t width : fc) {
            net.add(std::make_unique<Dense>(engine, in_features, width, unit->rng()));
            net.add(std::make_unique<Activation>(ActivationKind::Relu));
            if (dropout > 0.0f) net.add(std::make_unique<Dropout>(dropout, unit->rng()));
            in_features = width;
        }
        net.add(std::make_unique<Dense>(engine, in_features, num_classes, unit->rng()));

        nlohmann::json resolved = architecture.is_object() ? architecture : nlohmann::json::object();
        resolved["input_channels"] = channels;
        resolved["num_classes"] = num_classes;
        resolved["conv_layers"] = conv;
        resolved["kernel_sizes"] = kernels;
        resolved["fc_layers"] = fc;
        resolved["pooling"] = pooling_name;
        return BuiltUnit{std::move(unit), std::move(resolved)};
    });
}

// ─────────────────────────────────────────────
// ModelBuilderRegistry
// ─────────────────────────────────────────────

ModelBuilderRegistry::ModelBuilderRegistry() {
    std::vector<std::unique_ptr<IModelBuilder>> builders;
    builders.push_back(std::make_unique<MlpBuilder>());
    builders.push_back(std::make_unique<RnnBuilder>());
    builders.push_back(std::make_unique<CnnBuilder>());
    for (auto& b : builders) {
        auto id = b->manifest().id;
        slots_.push_back(Slot{std::move(b), std::move(id), true});
    }
}

std::vector<BuilderManifest> ModelBuilderRegistry::list() const {
    std::lock_guard lock(mutex_);
    std::vector<BuilderManifest> out;
    for (const auto& slot : slots_) {
        auto m = slot.builder->manifest();
        m.enabled = slot.enabled;
        out.push_back(std::move(m));
    }
    return out;
}

Result<BuilderManifest> ModelBuilderRegistry::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    for (const auto& slot : slots_) {
        if (slot.id == id) {
            auto m = slot.builder->manifest();
            m.enabled = slot.enabled;
            return m;
        }
    }
    return Error{ErrorCode::NotFound, "Plugin not found: " + id};
}

Result<BuilderManifest> ModelBuilderRegistry::set_enabled(const std::string& id, bool enabled) {
    std::lock_guard lock(mutex_);
    for (auto& slot : slots_) {
        if (slot.id == id) {
            slot.enabled = enabled;
            auto m = slot.builder->manifest();
            m.enabled = enabled;
            return m;
        }
    }
    return Error{ErrorCode::NotFound, "Plugin not found: " + id};
}

Result<BuiltUnit> ModelBuilderRegistry::build(UnitType type, const nlohmann::json& architecture,
                                              const nlohmann::json& hyperparameters,
                                              INumericEngine& engine, const Device& device,
                                              uint32_t seed) {
    IModelBuilder* builder = nullptr;
    {
        std::lock_guard lock(mutex_);
        for (auto& slot : slots_) {
            if (slot.builder->type() == type) {
                if (!slot.enabled) {
                    return Error{ErrorCode::UnsupportedType,
                                 "Builder " + slot.id + " for " + std::string{to_string(type)}
                                 + " is disabled"};
                }
                builder = slot.builder.get();
                break;
            }
        }
    }
    if (!builder) {
        return Error{ErrorCode::UnsupportedType,
                     "No builder for model type " + std::string{to_string(type)}};
    }
    return builder->build(architecture, hyperparameters, engine, device, seed);
}

}  // namespace archetype
