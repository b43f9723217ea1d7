#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace signaldesk {
namespace core {

class ISignalStore {
public:
    virtual ~ISignalStore() = default;

    // Returns default_value when nothing is stored under the key
    virtual nlohmann::json load(const std::string& key, const nlohmann::json& default_value) = 0;
    virtual bool save(const std::string& key, const nlohmann::json& value) = 0;
};

} // namespace core
} // namespace signaldesk
