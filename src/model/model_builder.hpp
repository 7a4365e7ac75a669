/**
 * @file model_builder.hpp
 * @brief Architecture builders and their closed registry.
 *
 * A builder turns an architecture/hyperparameter bag into a TrainableUnit.
 * The registry is fixed at construction (MLP, RNN, CNN); builders can be
 * disabled and re-enabled at runtime but never loaded from disk.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "device/device.hpp"
#include "engine/numeric_engine.hpp"
#include "model/trainable_unit.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace archetype {

struct BuilderManifest {
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    UnitType unit_type{UnitType::Mlp};
    std::vector<std::string> component_types;
    nlohmann::json parameters = nlohmann::json::object();  ///< accepted keys with defaults
    bool enabled{true};
};

void to_json(nlohmann::json& j, const BuilderManifest& manifest);

struct BuiltUnit {
    std::shared_ptr<TrainableUnit> unit;
    nlohmann::json architecture;   ///< input bag with defaults filled in
};

class IModelBuilder {
public:
    virtual ~IModelBuilder() = default;

    [[nodiscard]] virtual UnitType type() const noexcept = 0;
    [[nodiscard]] virtual BuilderManifest manifest() const = 0;

    virtual Result<BuiltUnit> build(const nlohmann::json& architecture,
                                    const nlohmann::json& hyperparameters,
                                    INumericEngine& engine,
                                    const Device& device,
                                    uint32_t seed) = 0;
};

class MlpBuilder : public IModelBuilder {
public:
    [[nodiscard]] UnitType type() const noexcept override { return UnitType::Mlp; }
    [[nodiscard]] BuilderManifest manifest() const override;
    Result<BuiltUnit> build(const nlohmann::json& architecture, const nlohmann::json& hyperparameters,
                            INumericEngine& engine, const Device& device, uint32_t seed) override;
};

class RnnBuilder : public IModelBuilder {
public:
    [[nodiscard]] UnitType type() const noexcept override { return UnitType::Rnn; }
    [[nodiscard]] BuilderManifest manifest() const override;
    Result<BuiltUnit> build(const nlohmann::json& architecture, const nlohmann::json& hyperparameters,
                            INumericEngine& engine, const Device& device, uint32_t seed) override;
};

class CnnBuilder : public IModelBuilder {
public:
    [[nodiscard]] UnitType type() const noexcept override { return UnitType::Cnn; }
    [[nodiscard]] BuilderManifest manifest() const override;
    Result<BuiltUnit> build(const nlohmann::json& architecture, const nlohmann::json& hyperparameters,
                            INumericEngine& engine, const Device& device, uint32_t seed) override;
};

/**
 * @brief Builders keyed by unit type, with an enabled flag per builder.
 */
class ModelBuilderRegistry {
public:
    /// Registers the MLP, RNN and CNN builders.
    ModelBuilderRegistry();

    [[nodiscard]] std::vector<BuilderManifest> list() const;

    /// NotFound for an unknown builder id.
    [[nodiscard]] Result<BuilderManifest> get(const std::string& id) const;

    Result<BuilderManifest> set_enabled(const std::string& id, bool enabled);

    /// UnsupportedType when no enabled builder serves @p type.
    Result<BuiltUnit> build(UnitType type, const nlohmann::json& architecture,
                            const nlohmann::json& hyperparameters, INumericEngine& engine,
                            const Device& device, uint32_t seed);

private:
    struct Slot {
        std::unique_ptr<IModelBuilder> builder;
        std::string id;
        bool enabled{true};
    };

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
};

}  // namespace archetype
