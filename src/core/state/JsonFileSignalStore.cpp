#include "core/state/JsonFileSignalStore.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace signaldesk {
namespace core {

JsonFileSignalStore::JsonFileSignalStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::filesystem::path JsonFileSignalStore::pathFor(const std::string& key) const {
    return data_dir_ / (key + ".json");
}

nlohmann::json JsonFileSignalStore::load(const std::string& key, const nlohmann::json& default_value) {
    const auto file_path = pathFor(key);
    if (!std::filesystem::exists(file_path)) {
        LOG_DEBUG("No stored file for '{}', using default", key);
        return default_value;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Failed to open {}", file_path.string());
        return default_value;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed JSON in {}: {}", file_path.string(), e.what());
        return default_value;
    }
}

bool JsonFileSignalStore::save(const std::string& key, const nlohmann::json& value) {
    const auto file_path = pathFor(key);

    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        LOG_ERROR("Failed to create data directory {}: {}", data_dir_.string(), ec.message());
        return false;
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Failed to open {} for writing", tmp_path.string());
            return false;
        }
        out << value.dump(2);
        out.flush();
        if (!out) {
            LOG_ERROR("Failed to write {}", tmp_path.string());
            return false;
        }
    }

    if (std::filesystem::exists(file_path)) {
        auto bak_path = file_path;
        bak_path.replace_extension(".bak");
        std::filesystem::copy_file(
            file_path,
            bak_path,
            std::filesystem::copy_options::overwrite_existing,
            ec
        );
        if (ec) {
            LOG_WARN("Backup of {} failed: {}", file_path.string(), ec.message());
            ec.clear();
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        LOG_ERROR("Failed to replace {}: {}", file_path.string(), ec.message());
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp_path, cleanup_ec);
        return false;
    }

    LOG_DEBUG("Saved {}", file_path.string());
    return true;
}

} // namespace core
} // namespace signaldesk
