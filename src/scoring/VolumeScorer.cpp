#include "scoring/VolumeScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace confluence {
namespace scoring {

using analytics::TechnicalIndicators;

ScoreResult VolumeScorer::score(const features::VolumeFeatures& features) {
    std::map<std::string, double> debug = {
        {"volume_rvol_20_1", features.rvol_20_1},
        {"volume_trend_slope_pct_20_10", features.trend_slope_pct_20_10},
        {"volume_percentile_60", features.percentile_60},
        {"has_volume_data", features.has_data ? 1.0 : 0.0}
    };

    if (!features.has_data) {
        return neutralResult(std::move(debug));
    }

    const double s_rvol = rvolScore(features.rvol_20_1, 1.5, 3.0);
    const double s_slope = slopeScore(features.trend_slope_pct_20_10, 20.0);
    const double s_pct = percentileScore(features.percentile_60);

    debug["volume_rvol_score"] = s_rvol;
    debug["volume_trend_slope_score"] = s_slope;
    debug["volume_percentile_score"] = s_pct;

    ScoreResult result;
    result.score = sanitizeScore(0.45 * s_rvol + 0.25 * s_slope + 0.30 * s_pct);
    result.available = true;
    result.features = std::move(debug);
    return result;
}

double VolumeScorer::rvolScore(double rvol, double ideal_low, double ideal_high) {
    if (std::isnan(rvol) || rvol <= 0.0) {
        return 0.0;
    }
    if (rvol < 1.0) {
        return TechnicalIndicators::clamp(rvol * 60.0, 0.0, 60.0);
    }
    if (rvol < ideal_low) {
        const double t = (rvol - 1.0) / (ideal_low - 1.0);
        return 60.0 + t * 20.0;
    }
    if (rvol <= ideal_high) {
        const double t = (rvol - ideal_low) / (ideal_high - ideal_low);
        return 80.0 + t * 20.0;
    }

    const double extra = rvol - ideal_high;
    if (extra >= 4.0) {
        return 70.0;
    }
    return 100.0 - (extra / 4.0) * 30.0;
}

double VolumeScorer::slopeScore(double slope_pct, double max_abs) {
    if (!std::isfinite(slope_pct) || max_abs <= 0.0) return kNeutralScore;
    const double s = std::max(-max_abs, std::min(max_abs, slope_pct));
    return (s + max_abs) / (2.0 * max_abs) * 100.0;
}

double VolumeScorer::percentileScore(double percentile) {
    return TechnicalIndicators::clamp(percentile * 100.0);
}

} // namespace scoring
} // namespace confluence
