#include "alerts/AlertTypes.h"

namespace confluence {
namespace alerts {

std::string rsiDivergenceReason(bool bullish, const std::string& timeframe) {
    return std::string(bullish ? "RSI_BULLISH_DIVERGENCE_" : "RSI_BEARISH_DIVERGENCE_") + timeframe;
}

nlohmann::json AlertState::toJson() const {
    nlohmann::json raw;
    nlohmann::json symbols_json = nlohmann::json::object();
    for (const auto& [symbol, entry] : symbols) {
        nlohmann::json item = nlohmann::json::object();
        if (entry.last_cs) item["last_cs"] = *entry.last_cs;
        if (entry.last_ts) item["last_ts"] = *entry.last_ts;
        symbols_json[symbol] = item;
    }
    raw["symbols"] = symbols_json;
    if (global_regime) {
        raw["global_regime"] = *global_regime;
    }
    return raw;
}

AlertState AlertState::fromJson(const nlohmann::json& raw) {
    AlertState state;
    if (!raw.is_object()) {
        return state;
    }

    auto symbols_it = raw.find("symbols");
    if (symbols_it != raw.end() && symbols_it->is_object()) {
        for (auto it = symbols_it->begin(); it != symbols_it->end(); ++it) {
            if (!it.value().is_object()) {
                continue;
            }
            SymbolAlertState entry;
            auto cs = it.value().find("last_cs");
            if (cs != it.value().end() && cs->is_number()) {
                entry.last_cs = cs->get<double>();
            }
            auto ts = it.value().find("last_ts");
            if (ts != it.value().end() && ts->is_string()) {
                entry.last_ts = ts->get<std::string>();
            }
            state.symbols[it.key()] = entry;
        }
    }

    auto regime_it = raw.find("global_regime");
    if (regime_it != raw.end() && regime_it->is_string()) {
        state.global_regime = regime_it->get<std::string>();
    }
    return state;
}

} // namespace alerts
} // namespace confluence
