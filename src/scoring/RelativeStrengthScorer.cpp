#include "scoring/RelativeStrengthScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <cmath>
#include <utility>
#include <string>

namespace confluence {
namespace scoring {

using analytics::TechnicalIndicators;

ScoreResult RelativeStrengthScorer::score(const features::RsFeatures& features) {
    std::map<std::string, double> debug;
    for (const auto& horizon : features.horizons) {
        const std::string h = std::to_string(horizon.bars);
        debug["rs_ret_" + h + "_pct"] = horizon.return_pct;
        if (horizon.rank_pct) {
            debug["rs_" + h + "_rank_pct"] = *horizon.rank_pct;
        }
    }
    debug["has_rs_data"] = features.has_data ? 1.0 : 0.0;

    if (!features.has_data) {
        return neutralResult(std::move(debug));
    }

    double weighted = 0.0;
    double used_weight = 0.0;
    for (const auto& horizon : features.horizons) {
        const double w = horizonWeight(horizon.bars);
        if (!horizon.available || w <= 0.0) {
            continue;
        }

        const std::string h = std::to_string(horizon.bars);
        double s = 0.0;
        if (horizon.rank_pct && std::isfinite(*horizon.rank_pct)) {
            s = TechnicalIndicators::clamp(*horizon.rank_pct);
        } else {
            s = returnScore(horizon.return_pct);
        }
        debug["rs_" + h + "_score"] = s;

        weighted += w * s;
        used_weight += w;
    }

    if (used_weight <= 0.0) {
        return neutralResult(std::move(debug));
    }

    ScoreResult result;
    result.score = sanitizeScore(weighted / used_weight);
    result.available = true;
    result.features = std::move(debug);
    return result;
}

double RelativeStrengthScorer::returnScore(double ret_pct, double neg_cap, double pos_cap) {
    if (std::isnan(ret_pct)) return kNeutralScore;
    if (ret_pct <= neg_cap) return 0.0;
    if (ret_pct >= pos_cap) return 100.0;
    return TechnicalIndicators::clamp((ret_pct - neg_cap) / (pos_cap - neg_cap) * 100.0);
}

double RelativeStrengthScorer::horizonWeight(int bars) {
    switch (bars) {
        case 20: return 0.45;
        case 60: return 0.35;
        case 120: return 0.20;
        default: return 0.0;
    }
}

} // namespace scoring
} // namespace confluence
