#include "scoring/PositioningScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace confluence {
namespace scoring {

using analytics::TechnicalIndicators;

namespace {
double lerp(double x, double x0, double x1, double y0, double y1) {
    return y0 + (x - x0) / (x1 - x0) * (y1 - y0);
}
}

ScoreResult PositioningScorer::score(const features::PositioningFeatures& features) {
    std::map<std::string, double> debug = {
        {"positioning_funding_rate", features.funding_rate},
        {"positioning_oi_change_pct", features.oi_change_pct},
        {"has_positioning_data", features.has_data ? 1.0 : 0.0}
    };

    if (!features.has_data) {
        return neutralResult(std::move(debug));
    }

    const double s_funding = fundingCrowdingScore(features.funding_rate);
    const double s_oi = oiBuildUpScore(features.oi_change_pct);

    debug["positioning_funding_crowding_score"] = s_funding;
    debug["positioning_oi_build_up_score"] = s_oi;

    ScoreResult result;
    result.score = sanitizeScore(0.7 * s_funding + 0.3 * s_oi);
    result.available = true;
    result.features = std::move(debug);
    return result;
}

double PositioningScorer::fundingCrowdingScore(double funding_rate) {
    if (!std::isfinite(funding_rate)) return kNeutralScore;

    const double pct = std::abs(funding_rate) * 100.0;
    if (pct <= 0.01) return 100.0;
    if (pct <= 0.05) return lerp(pct, 0.01, 0.05, 100.0, 70.0);
    if (pct <= 0.10) return lerp(pct, 0.05, 0.10, 70.0, 40.0);
    if (pct <= 0.20) return lerp(pct, 0.10, 0.20, 40.0, 10.0);
    return 10.0;
}

double PositioningScorer::oiBuildUpScore(double oi_change_pct) {
    if (!std::isfinite(oi_change_pct)) return kNeutralScore;
    const double c = std::max(-100.0, std::min(100.0, oi_change_pct));
    return TechnicalIndicators::clamp((c + 100.0) / 200.0 * 100.0);
}

} // namespace scoring
} // namespace confluence
