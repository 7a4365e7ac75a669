/**
 * @file metadata_store.cpp
 * @brief Metadata store implementations.
 */

#include "model/metadata_store.hpp"

#include <fstream>
#include <system_error>

namespace archetype {

namespace fs = std::filesystem;

// ── JsonFileMetadataStore ────────────────────

JsonFileMetadataStore::JsonFileMetadataStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path JsonFileMetadataStore::path_for(const std::string& id) const {
    return dir_ / (id + ".json");
}

Result<void> JsonFileMetadataStore::save(const std::string& id, const nlohmann::json& record) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) return Error{ErrorCode::Io, "Cannot create " + dir_.string() + ": " + ec.message()};

    auto final_path = path_for(id);
    auto tmp_path = final_path;
    tmp_path += ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os) return Error{ErrorCode::Io, "Cannot write " + tmp_path.string()};
        os << record.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!os) return Error{ErrorCode::Io, "Write failed for " + tmp_path.string()};
    }
    fs::rename(tmp_path, final_path, ec);
    if (ec) return Error{ErrorCode::Io, "Cannot rename to " + final_path.string() + ": " + ec.message()};
    return {};
}

Result<nlohmann::json> JsonFileMetadataStore::load(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto path = path_for(id);
    std::ifstream is(path);
    if (!is) return Error{ErrorCode::NotFound, "No metadata for " + id};
    auto record = nlohmann::json::parse(is, nullptr, false);
    if (record.is_discarded()) {
        return Error{ErrorCode::Io, "Corrupt metadata file " + path.string()};
    }
    return record;
}

Result<void> JsonFileMetadataStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(id), ec);
    if (ec) return Error{ErrorCode::Io, "Cannot delete metadata for " + id + ": " + ec.message()};
    return {};
}

Result<std::vector<std::string>> JsonFileMetadataStore::ids() {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return out;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.path().extension() == ".json") {
            out.push_back(entry.path().stem().string());
        }
    }
    if (ec) return Error{ErrorCode::Io, "Cannot list " + dir_.string() + ": " + ec.message()};
    return out;
}

// ── InMemoryMetadataStore ────────────────────

Result<void> InMemoryMetadataStore::save(const std::string& id, const nlohmann::json& record) {
    std::lock_guard lock(mutex_);
    records_[id] = record;
    return {};
}

Result<nlohmann::json> InMemoryMetadataStore::load(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return Error{ErrorCode::NotFound, "No metadata for " + id};
    return it->second;
}

Result<void> InMemoryMetadataStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    records_.erase(id);
    return {};
}

Result<std::vector<std::string>> InMemoryMetadataStore::ids() {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [id, _] : records_) out.push_back(id);
    return out;
}

}  // namespace archetype
