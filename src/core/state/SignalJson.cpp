#include "core/state/SignalJson.h"
#include "common/Logger.h"

namespace signaldesk {
namespace core {

nlohmann::json toJson(const engine::SignalRecord& signal) {
    nlohmann::json line;
    line["signal_id"] = signal.signal_id;
    line["symbol"] = signal.symbol;
    line["signal_type"] = toString(signal.type);
    line["entry_price"] = signal.entry_price;
    line["confidence"] = signal.confidence;
    line["stop_loss"] = signal.stop_loss;
    line["take_profit"] = signal.take_profit;
    line["atr"] = signal.atr_at_entry;
    line["risk_reward"] = signal.risk_reward_ratio;
    line["status"] = toString(signal.status);
    line["created_at_ms"] = signal.created_at_ms;

    if (signal.closed_at_ms) {
        line["closed_at_ms"] = *signal.closed_at_ms;
    }
    if (signal.close_price) {
        line["close_price"] = *signal.close_price;
    }
    if (signal.pnl_percent) {
        line["pnl_percent"] = *signal.pnl_percent;
    }
    if (signal.duration_minutes) {
        line["duration_minutes"] = *signal.duration_minutes;
    }
    return line;
}

std::optional<engine::SignalRecord> signalFromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }

    try {
        engine::SignalRecord signal;
        signal.signal_id = raw.at("signal_id").get<std::string>();
        signal.symbol = raw.at("symbol").get<std::string>();

        auto type = signalTypeFromString(raw.at("signal_type").get<std::string>());
        auto status = signalStatusFromString(raw.at("status").get<std::string>());
        if (!type || *type == SignalType::HOLD || !status) {
            return std::nullopt;
        }
        signal.type = *type;
        signal.status = *status;

        signal.entry_price = raw.at("entry_price").get<double>();
        signal.confidence = raw.at("confidence").get<double>();
        signal.stop_loss = raw.at("stop_loss").get<double>();
        signal.take_profit = raw.at("take_profit").get<double>();
        signal.atr_at_entry = raw.value("atr", 0.0);
        signal.risk_reward_ratio = raw.value("risk_reward", 0.0);
        signal.created_at_ms = raw.at("created_at_ms").get<long long>();

        if (raw.contains("closed_at_ms")) {
            signal.closed_at_ms = raw["closed_at_ms"].get<long long>();
        }
        if (raw.contains("close_price")) {
            signal.close_price = raw["close_price"].get<double>();
        }
        if (raw.contains("pnl_percent")) {
            signal.pnl_percent = raw["pnl_percent"].get<double>();
        }
        if (raw.contains("duration_minutes")) {
            signal.duration_minutes = raw["duration_minutes"].get<double>();
        }
        return signal;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

nlohmann::json activeSignalsToJson(const std::vector<engine::SignalRecord>& signals) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& signal : signals) {
        out[signal.signal_id] = toJson(signal);
    }
    return out;
}

std::vector<engine::SignalRecord> activeSignalsFromJson(const nlohmann::json& raw) {
    std::vector<engine::SignalRecord> out;
    if (!raw.is_object()) {
        LOG_WARN("Active signal set is not a JSON object, ignoring it");
        return out;
    }

    for (auto it = raw.begin(); it != raw.end(); ++it) {
        auto signal = signalFromJson(it.value());
        if (!signal || !signal->isActive()) {
            LOG_WARN("Skipping malformed active signal entry: {}", it.key());
            continue;
        }
        out.push_back(*signal);
    }
    return out;
}

nlohmann::json performanceLogToJson(const std::vector<engine::SignalRecord>& closed) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& signal : closed) {
        out.push_back(toJson(signal));
    }
    return out;
}

std::vector<engine::SignalRecord> performanceLogFromJson(const nlohmann::json& raw) {
    std::vector<engine::SignalRecord> out;
    if (!raw.is_array()) {
        LOG_WARN("Performance log is not a JSON array, ignoring it");
        return out;
    }

    for (const auto& line : raw) {
        auto signal = signalFromJson(line);
        if (!signal || signal->isActive() || !signal->closed_at_ms || !signal->pnl_percent) {
            LOG_WARN("Skipping malformed performance entry");
            continue;
        }
        out.push_back(*signal);
    }
    return out;
}

} // namespace core
} // namespace signaldesk
