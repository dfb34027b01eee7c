#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace confluence {
namespace alerts {

// Symbol used by market-wide events
constexpr const char* kGlobalSymbol = "__GLOBAL__";

constexpr const char* kReasonHighConfluence = "HIGH_CONFLUENCE";
constexpr const char* kReasonVolumeSpike = "VOLUME_SPIKE";
constexpr const char* kReasonSqueezeCandidate = "SQUEEZE_CANDIDATE";
constexpr const char* kReasonRegimeChange = "REGIME_CHANGE";

// RSI_BULLISH_DIVERGENCE_<tf> / RSI_BEARISH_DIVERGENCE_<tf>
std::string rsiDivergenceReason(bool bullish, const std::string& timeframe);

struct AlertEvent {
    std::string symbol;
    Timestamp created_at;
    std::string reason;
    std::string message;
    double confluence_score = 0.0;

    std::optional<double> trend_score;
    std::optional<double> volatility_score;
    std::optional<double> volume_score;
    std::optional<double> rs_score;
    std::optional<double> positioning_score;

    std::string regime_label;
};

struct SymbolAlertState {
    std::optional<double> last_cs;
    std::optional<std::string> last_ts;     // YYYY-MM-DDTHH:MM:SSZ
};

// {"symbols": {sym: {"last_cs", "last_ts"}}, "global_regime": label}
struct AlertState {
    std::map<std::string, SymbolAlertState> symbols;
    std::optional<std::string> global_regime;

    nlohmann::json toJson() const;
    // Entries of the wrong shape are dropped
    static AlertState fromJson(const nlohmann::json& raw);
};

} // namespace alerts
} // namespace confluence
