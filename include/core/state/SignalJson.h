#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/SignalRecord.h"

namespace signaldesk {
namespace core {

// Enums are written as upper-case names, timestamps as epoch-ms integers.
// Closing fields are omitted while absent.
nlohmann::json toJson(const engine::SignalRecord& signal);

// nullopt when a required key is missing or has the wrong type
std::optional<engine::SignalRecord> signalFromJson(const nlohmann::json& raw);

// Open set is stored as an object keyed by signal_id
nlohmann::json activeSignalsToJson(const std::vector<engine::SignalRecord>& signals);
std::vector<engine::SignalRecord> activeSignalsFromJson(const nlohmann::json& raw);

// Performance log is stored as an array of closed signals
nlohmann::json performanceLogToJson(const std::vector<engine::SignalRecord>& closed);
std::vector<engine::SignalRecord> performanceLogFromJson(const nlohmann::json& raw);

} // namespace core
} // namespace signaldesk
