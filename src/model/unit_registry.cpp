/**
 * @file unit_registry.cpp
 * @brief UnitRegistry implementation.
 */

#include "model/unit_registry.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace archetype {

std::optional<ExportFormat> parse_export_format(std::string_view text) {
    std::string lower{text};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "pt" || lower == "pth" || lower == "bin") return ExportFormat::Native;
    if (lower == "json") return ExportFormat::Interchange;
    return std::nullopt;
}

UnitRegistry::UnitRegistry(ModelBuilderRegistry& builders, DeviceSelector& selector,
                           INumericEngine& engine, IMetadataStore& store, Logger& logger,
                           Options options, MetricsCollector* metrics)
    : builders_(builders)
    , selector_(selector)
    , engine_(engine)
    , store_(store)
    , logger_(logger)
    , options_(std::move(options))
    , metrics_(metrics) {}

Result<void> UnitRegistry::persist(const UnitMetadata& meta) {
    nlohmann::json record = meta;
    return store_.save(meta.id, record);
}

Result<BuiltUnit> UnitRegistry::build_on_active_device(UnitType type,
                                                       const nlohmann::json& architecture,
                                                       const nlohmann::json& hyperparameters) {
    uint32_t seed = 0;
    if (hyperparameters.is_object() && hyperparameters.contains("seed")
        && hyperparameters.at("seed").is_number_unsigned()) {
        seed = hyperparameters.at("seed").get<uint32_t>();
    } else {
        seed = std::random_device{}();
    }
    // Holding the selection lock keeps the device stable for the whole build
    return selector_.with_active_device([&](const Device& device) {
        return builders_.build(type, architecture, hyperparameters, engine_, device, seed);
    });
}

Result<UnitMetadata> UnitRegistry::create(const std::string& name, std::string_view type_tag,
                                          const nlohmann::json& architecture,
                                          const nlohmann::json& hyperparameters) {
    auto type = parse_unit_type(type_tag);
    if (!type) {
        return Error{ErrorCode::UnsupportedType, "Unsupported model type: " + std::string{type_tag}};
    }

    auto built = build_on_active_device(*type, architecture, hyperparameters);
    if (!built) return built.error();

    UnitMetadata meta;
    meta.id = generate_uuid();
    meta.name = name;
    meta.type = *type;
    meta.architecture = built->architecture;
    meta.hyperparameters = hyperparameters.is_object() ? hyperparameters : nlohmann::json::object();
    meta.parameter_count = built->unit->parameter_count();
    meta.created_at = std::chrono::system_clock::now();
    meta.updated_at = meta.created_at;
    meta.device_id = built->unit->device_id();

    if (auto saved = persist(meta); !saved) {
        logger_.warn("Failed to persist metadata for " + meta.id + ": " + saved.error().message);
    }

    {
        std::unique_lock lock(mutex_);
        entries_.emplace(meta.id, Entry{meta, built->unit});
        order_.push_back(meta.id);
    }

    logger_.info("Created " + std::string{to_string(meta.type)} + " unit '" + meta.name + "' ("
                 + meta.id + ") with " + std::to_string(meta.parameter_count)
                 + " parameters on " + meta.device_id);
    if (metrics_) metrics_->record_unit_event(meta.id, "created", meta.type);
    return meta;
}

Result<UnitMetadata> UnitRegistry::get(const UnitId& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return Error{ErrorCode::NotFound, "Model not found: " + id};
    return it->second.metadata;
}

std::vector<UnitMetadata> UnitRegistry::list(size_t offset, size_t limit) const {
    std::shared_lock lock(mutex_);
    std::vector<UnitMetadata> out;
    for (size_t i = offset; i < order_.size() && out.size() < limit; ++i) {
        out.push_back(entries_.at(order_[i]).metadata);
    }
    return out;
}

size_t UnitRegistry::count() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

Result<UnitMetadata> UnitRegistry::update(const UnitId& id, const nlohmann::json& patch) {
    if (!patch.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Update body must be a JSON object"};
    }
    for (const auto& [key, value] : patch.items()) {
        if (key == "name" || key == "status") {
            if (!value.is_string()) {
                return Error{ErrorCode::InvalidArgument, key + " must be a string"};
            }
        } else if (key == "hyperparameters") {
            if (!value.is_object()) {
                return Error{ErrorCode::InvalidArgument, "hyperparameters must be an object"};
            }
        } else {
            return Error{ErrorCode::InvalidArgument, "Field cannot be updated: " + key};
        }
    }

    UnitMetadata meta;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return Error{ErrorCode::NotFound, "Model not found: " + id};
        auto& stored = it->second.metadata;
        if (patch.contains("name")) stored.name = patch.at("name").get<std::string>();
        if (patch.contains("status")) stored.status = patch.at("status").get<std::string>();
        if (patch.contains("hyperparameters")) stored.hyperparameters.merge_patch(patch.at("hyperparameters"));
        stored.updated_at = std::chrono::system_clock::now();
        meta = stored;
    }

    if (auto saved = persist(meta); !saved) return saved.error();
    logger_.info("Updated model " + id);
    return meta;
}

Result<void> UnitRegistry::remove(const UnitId& id) {
    UnitType type{};
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return Error{ErrorCode::NotFound, "Model not found: " + id};
        if (it->second.unit.use_count() > 1) {
            return Error{ErrorCode::InvalidState, "Model " + id + " is in use by a training job"};
        }
        type = it->second.metadata.type;
        entries_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    if (auto removed = store_.remove(id); !removed) {
        logger_.warn("Failed to delete metadata for " + id + ": " + removed.error().message);
    }
    logger_.info("Deleted model " + id);
    if (metrics_) metrics_->record_unit_event(id, "deleted", type);
    return {};
}

Result<std::filesystem::path> UnitRegistry::export_unit(const UnitId& id, std::string_view format) {
    auto kind = parse_export_format(format);
    if (!kind) {
        return Error{ErrorCode::UnsupportedFormat, "Unsupported export format: " + std::string{format}};
    }

    UnitMetadata meta;
    std::shared_ptr<TrainableUnit> unit;
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return Error{ErrorCode::NotFound, "Model not found: " + id};
        meta = it->second.metadata;
        unit = it->second.unit;
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.export_dir, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create " + options_.export_dir.string() + ": " + ec.message()};
    }
    auto path = options_.export_dir / (id + "." + std::string{format});

    auto written = *kind == ExportFormat::Native ? unit->save_native(path, meta)
                                                 : unit->save_interchange(path, meta);
    if (!written) return written.error();

    logger_.info("Exported model " + id + " to " + path.string());
    if (metrics_) metrics_->record_unit_event(id, "exported", meta.type);
    return path;
}

Result<std::shared_ptr<TrainableUnit>> UnitRegistry::acquire(const UnitId& id) {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return Error{ErrorCode::NotFound, "Model not found: " + id};
    return it->second.unit;
}

Result<void> UnitRegistry::set_status(const UnitId& id, const std::string& status) {
    UnitMetadata meta;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return Error{ErrorCode::NotFound, "Model not found: " + id};
        it->second.metadata.status = status;
        it->second.metadata.updated_at = std::chrono::system_clock::now();
        meta = it->second.metadata;
    }
    return persist(meta);
}

size_t UnitRegistry::restore() {
    auto ids = store_.ids();
    if (!ids) {
        logger_.warn("Cannot enumerate stored models: " + ids.error().message);
        return 0;
    }

    std::vector<UnitMetadata> stored;
    for (const auto& id : *ids) {
        auto record = store_.load(id);
        if (!record) {
            logger_.warn("Skipping model " + id + ": " + record.error().message);
            continue;
        }
        try {
            stored.push_back(record->get<UnitMetadata>());
        } catch (const std::exception& e) {
            logger_.warn("Skipping model " + id + ": " + e.what());
        }
    }
    std::sort(stored.begin(), stored.end(),
              [](const auto& a, const auto& b) { return a.created_at < b.created_at; });

    size_t restored = 0;
    for (auto& meta : stored) {
        {
            std::shared_lock lock(mutex_);
            if (entries_.count(meta.id)) continue;
        }
        auto built = build_on_active_device(meta.type, meta.architecture, meta.hyperparameters);
        if (!built) {
            logger_.warn("Cannot rebuild model " + meta.id + ": " + built.error().message);
            continue;
        }
        meta.parameter_count = built->unit->parameter_count();
        meta.device_id = built->unit->device_id();

        std::unique_lock lock(mutex_);
        order_.push_back(meta.id);
        entries_.emplace(meta.id, Entry{meta, built->unit});
        ++restored;
    }
    if (restored > 0) {
        logger_.info("Restored " + std::to_string(restored) + " model(s) with fresh weights");
    }
    return restored;
}

}  // namespace archetype
