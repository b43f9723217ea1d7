#pragma once

#include <filesystem>

#include "core/contracts/ISignalStore.h"

namespace signaldesk {
namespace core {

// One pretty-printed <key>.json per key under the data directory.
// The previous file is kept as <key>.bak.
class JsonFileSignalStore : public ISignalStore {
public:
    explicit JsonFileSignalStore(std::filesystem::path data_dir);

    nlohmann::json load(const std::string& key, const nlohmann::json& default_value) override;
    bool save(const std::string& key, const nlohmann::json& value) override;

    std::filesystem::path pathFor(const std::string& key) const;

private:
    std::filesystem::path data_dir_;
};

} // namespace core
} // namespace signaldesk
