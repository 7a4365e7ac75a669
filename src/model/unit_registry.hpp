/**
 * @file unit_registry.hpp
 * @brief UnitRegistry: owns trainable units and their persisted metadata.
 *
 * Units are built against the active device at creation time. Jobs borrow a
 * unit through acquire(); while such a borrow is alive the unit cannot be
 * deleted.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "device/device_selector.hpp"
#include "engine/numeric_engine.hpp"
#include "model/metadata_store.hpp"
#include "model/model_builder.hpp"
#include "model/trainable_unit.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace archetype {

class MetricsCollector;

enum class ExportFormat : uint8_t { Native, Interchange };

/// pt, pth and bin are native; json is interchange.
[[nodiscard]] std::optional<ExportFormat> parse_export_format(std::string_view text);

class UnitRegistry {
public:
    struct Options {
        std::filesystem::path export_dir = "./models";
    };

    UnitRegistry(ModelBuilderRegistry& builders, DeviceSelector& selector, INumericEngine& engine,
                 IMetadataStore& store, Logger& logger, Options options,
                 MetricsCollector* metrics = nullptr);

    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    /// UnsupportedType for an unknown or disabled type tag.
    Result<UnitMetadata> create(const std::string& name, std::string_view type_tag,
                                const nlohmann::json& architecture,
                                const nlohmann::json& hyperparameters);

    [[nodiscard]] Result<UnitMetadata> get(const UnitId& id) const;

    /// Creation order.
    [[nodiscard]] std::vector<UnitMetadata> list(size_t offset = 0, size_t limit = 100) const;

    [[nodiscard]] size_t count() const;

    /// Accepts name, status and hyperparameters (merge-patch); other keys are InvalidArgument.
    Result<UnitMetadata> update(const UnitId& id, const nlohmann::json& patch);

    /// InvalidState while a job holds the unit.
    Result<void> remove(const UnitId& id);

    Result<std::filesystem::path> export_unit(const UnitId& id, std::string_view format);

    /// Borrow the unit for training.
    Result<std::shared_ptr<TrainableUnit>> acquire(const UnitId& id);

    /// Sets the status tag without touching anything else.
    Result<void> set_status(const UnitId& id, const std::string& status);

    /// Rebuild units from stored metadata; returns how many came back.
    size_t restore();

private:
    struct Entry {
        UnitMetadata metadata;
        std::shared_ptr<TrainableUnit> unit;
    };

    Result<void> persist(const UnitMetadata& meta);
    Result<BuiltUnit> build_on_active_device(UnitType type, const nlohmann::json& architecture,
                                             const nlohmann::json& hyperparameters);

    ModelBuilderRegistry& builders_;
    DeviceSelector& selector_;
    INumericEngine& engine_;
    IMetadataStore& store_;
    Logger& logger_;
    Options options_;
    MetricsCollector* metrics_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<UnitId, Entry> entries_;
    std::vector<UnitId> order_;
};

}  // namespace archetype
