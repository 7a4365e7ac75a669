/**
 * @file metadata_store.hpp
 * @brief Flat key/value persistence for unit metadata.
 */

#pragma once

#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace archetype {

/**
 * @brief One JSON record per id.
 */
class IMetadataStore {
public:
    virtual ~IMetadataStore() = default;

    virtual Result<void> save(const std::string& id, const nlohmann::json& record) = 0;

    /// NotFound when no record exists.
    virtual Result<nlohmann::json> load(const std::string& id) = 0;

    /// Absent records are not an error.
    virtual Result<void> remove(const std::string& id) = 0;

    /// Every stored id, unordered.
    virtual Result<std::vector<std::string>> ids() = 0;
};

/**
 * @brief `<dir>/<id>.json` files, written via a temp file and rename.
 */
class JsonFileMetadataStore : public IMetadataStore {
public:
    explicit JsonFileMetadataStore(std::filesystem::path dir);

    Result<void> save(const std::string& id, const nlohmann::json& record) override;
    Result<nlohmann::json> load(const std::string& id) override;
    Result<void> remove(const std::string& id) override;
    Result<std::vector<std::string>> ids() override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

private:
    [[nodiscard]] std::filesystem::path path_for(const std::string& id) const;

    std::filesystem::path dir_;
    std::mutex mutex_;
};

class InMemoryMetadataStore : public IMetadataStore {
public:
    Result<void> save(const std::string& id, const nlohmann::json& record) override;
    Result<nlohmann::json> load(const std::string& id) override;
    Result<void> remove(const std::string& id) override;
    Result<std::vector<std::string>> ids() override;

private:
    std::mutex mutex_;
    std::map<std::string, nlohmann::json> records_;
};

}  // namespace archetype
