#pragma once

#include <string>
#include <vector>

namespace confluence {
namespace pattern {

struct BreakoutParams {
    int lookback = 20;
    double break_buffer_pct = 0.1;
    double min_rvol = 1.5;
    double min_trend_score = 50.0;
    double min_volume_score = 50.0;
    double min_rs_score = 0.0;
    double min_confluence = 0.0;
    bool allow_bearish = false;
};

struct PullbackParams {
    int lookback = 15;
    double min_trend_score = 60.0;
    double min_rs_score = 40.0;
    double min_pullback_pct = 2.0;
    double max_pullback_pct = 10.0;
    double ma_proximity_pct = 5.0;
    double max_rvol = 2.0;
    double max_rsi_in_trend = 55.0;
    int rsi_period = 14;
};

struct VolatilitySqueezeParams {
    double max_bb_width_pct = 6.0;
    double max_contraction_ratio = 1.0;
    double min_volatility_score = 60.0;
    double min_trend_score = 0.0;
    double min_rs_score = 0.0;
};

struct RsiDivergenceParams {
    int lookback = 150;
    int period = 14;
    int pivot_lookback = 3;
    double min_strength = 1.0;
    int max_bars_from_last = 5;
};

// patterns.* section
struct PatternsConfig {
    // Empty -> every registered detector
    std::vector<std::string> enabled;

    BreakoutParams breakout;
    PullbackParams pullback;
    VolatilitySqueezeParams volatility_squeeze;
    RsiDivergenceParams rsi_divergence;
};

} // namespace pattern
} // namespace confluence
