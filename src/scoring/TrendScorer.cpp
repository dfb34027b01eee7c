#include "scoring/TrendScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace confluence {
namespace scoring {

using analytics::TechnicalIndicators;

ScoreResult TrendScorer::score(const features::TrendFeatures& features) {
    std::map<std::string, double> debug = {
        {"trend_ma_alignment", features.ma_alignment},
        {"trend_persistence", features.persistence},
        {"trend_distance_from_ma_pct", features.distance_from_ma_pct},
        {"trend_ma_slope_pct", features.ma_slope_pct},
        {"has_trend_data", features.has_data ? 1.0 : 0.0}
    };

    if (!features.has_data) {
        return neutralResult(std::move(debug));
    }

    const double s_align = alignmentScore(features.ma_alignment);
    const double s_persist = persistenceScore(features.persistence);
    const double s_dist = extensionScore(features.distance_from_ma_pct, 5.0);
    const double s_slope = slopeScore(features.ma_slope_pct, 5.0);

    debug["trend_ma_alignment_score"] = s_align;
    debug["trend_persistence_score"] = s_persist;
    debug["trend_distance_from_ma_score"] = s_dist;
    debug["trend_ma_slope_score"] = s_slope;

    ScoreResult result;
    result.score = sanitizeScore(0.35 * s_align + 0.30 * s_persist + 0.20 * s_dist + 0.15 * s_slope);
    result.available = true;
    result.features = std::move(debug);
    return result;
}

double TrendScorer::alignmentScore(double alignment) {
    return TechnicalIndicators::clamp((alignment + 1.0) * 50.0);
}

double TrendScorer::persistenceScore(double persistence) {
    return TechnicalIndicators::clamp(persistence * 100.0);
}

double TrendScorer::extensionScore(double distance_pct, double ideal_band) {
    if (!std::isfinite(distance_pct)) return 0.0;
    const double dist = std::abs(distance_pct);
    if (dist <= ideal_band) {
        return 100.0;
    }
    return TechnicalIndicators::clamp(100.0 - (dist - ideal_band) * 5.0);
}

double TrendScorer::slopeScore(double slope_pct, double max_abs) {
    if (!std::isfinite(slope_pct) || max_abs <= 0.0) return kNeutralScore;
    const double s = std::max(-max_abs, std::min(max_abs, slope_pct));
    return (s + max_abs) / (2.0 * max_abs) * 100.0;
}

} // namespace scoring
} // namespace confluence
