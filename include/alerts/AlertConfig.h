#pragma once

#include <string>
#include <vector>

namespace confluence {
namespace alerts {

struct AlertTypeToggles {
    bool high_confluence = true;
    bool volume_spike = true;
    bool squeeze_candidate = true;
    bool rsi_divergence = true;
    bool regime_change = true;
};

// alerts.* section
struct AlertsConfig {
    bool enabled = true;
    AlertTypeToggles types;

    double min_confluence_score = 60.0;
    double min_trend_score = 55.0;
    double min_volume_score = 50.0;
    double min_positioning_score = 50.0;
    double volume_spike_min_volume_score = 75.0;
    double squeeze_max_vol_score = 40.0;
    double squeeze_max_bbw_pct = 6.0;

    std::vector<std::string> rsi_divergence_timeframes{"4h"};
    int rsi_divergence_lookback = 150;
    int rsi_divergence_pivot_lookback = 3;
    double rsi_divergence_min_strength = 5.0;
    int rsi_divergence_max_bars_from_last = 1;

    bool require_uptrend_regime = false;

    int cooldown_minutes = 60;
    double min_cs_delta = 3.0;
    std::string state_file = "alerts_state.json";
    int scan_top_n = 100;
};

} // namespace alerts
} // namespace confluence
