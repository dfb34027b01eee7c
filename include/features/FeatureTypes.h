#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace confluence {
namespace features {

// Minimum history per family
constexpr size_t kTrendMinBars = 60;
constexpr size_t kVolatilityMinBars = 80;
constexpr size_t kVolumeMinBars = 40;
constexpr size_t kRelativeStrengthMinBars = 40;

struct TrendFeatures {
    double ma_alignment = 0.0;          // -1 / 0 / +1 (SMA20 vs SMA50)
    double persistence = 0.5;           // fraction of up-closes over 20 bars
    double distance_from_ma_pct = 0.0;  // last close vs SMA50
    double ma_slope_pct = 0.0;          // SMA50 change over 5 bars
    bool has_data = false;
};

struct VolatilityFeatures {
    double atr_pct_14 = 0.0;
    double bb_width_pct_20 = 0.0;
    double contraction_ratio_60_20 = 1.0;
    bool has_data = false;
};

struct VolumeFeatures {
    double rvol_20_1 = 1.0;
    double trend_slope_pct_20_10 = 0.0;
    double percentile_60 = 0.5;         // 0..1
    bool has_data = false;
};

struct RsHorizon {
    int bars = 0;
    double return_pct = 0.0;
    bool available = false;             // enough history for this lookback
    std::optional<double> rank_pct;     // set only with a universe context
};

struct RsFeatures {
    std::vector<RsHorizon> horizons;
    bool has_data = false;

    const RsHorizon* find(int bars) const;
};

struct PositioningFeatures {
    double funding_rate = 0.0;
    double oi_change_pct = 0.0;
    bool has_data = false;
};

struct FeatureBundle {
    TrendFeatures trend;
    VolatilityFeatures volatility;
    VolumeFeatures volume;
    RsFeatures rs;
    PositioningFeatures positioning;

    // Flat namespaced view, e.g. trend_ma_alignment, has_trend_data
    std::map<std::string, double> toMap() const;
};

// symbol -> horizon (bars) -> % return, built once per scan
using UniverseReturns = std::map<std::string, std::map<int, double>>;

const std::vector<int>& defaultRsHorizons();

} // namespace features
} // namespace confluence
