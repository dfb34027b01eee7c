#pragma once

#include <optional>

namespace confluence {
namespace ranking {

// ranking.filters.*  Floors of 0 pass everything; absent ceilings are off.
struct FilterConfig {
    double min_trend_score = 0.0;
    double min_rs_score = 0.0;
    double min_volume_score = 0.0;
    double min_volatility_score = 0.0;
    std::optional<double> max_atr_pct;
    std::optional<double> max_bb_width_pct;
};

struct RankingConfig {
    std::optional<int> top_n;          // ranking.top_n
    std::optional<int> reports_top_n;  // reports.top_n
    FilterConfig filters;

    double volume_surge_min_score = 70.0;
    double volatility_squeeze_min_score = 70.0;
    double watchlist_min_confluence = 70.0;
};

} // namespace ranking
} // namespace confluence
