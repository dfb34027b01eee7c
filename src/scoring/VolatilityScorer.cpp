#include "scoring/VolatilityScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <cmath>
#include <utility>

namespace confluence {
namespace scoring {

using analytics::TechnicalIndicators;

ScoreResult VolatilityScorer::score(const features::VolatilityFeatures& features) {
    std::map<std::string, double> debug = {
        {"volatility_atr_pct_14", features.atr_pct_14},
        {"volatility_bb_width_pct_20", features.bb_width_pct_20},
        {"volatility_contraction_ratio_60_20", features.contraction_ratio_60_20},
        {"has_volatility_data", features.has_data ? 1.0 : 0.0}
    };

    if (!features.has_data) {
        return neutralResult(std::move(debug));
    }

    const double s_atr = inverseScaleScore(features.atr_pct_14, 5.0);
    const double s_bb = inverseScaleScore(features.bb_width_pct_20, 10.0);
    const double s_contr = contractionRatioScore(features.contraction_ratio_60_20);

    debug["volatility_atr_score"] = s_atr;
    debug["volatility_bb_width_score"] = s_bb;
    debug["volatility_contraction_ratio_score"] = s_contr;

    ScoreResult result;
    result.score = sanitizeScore(0.30 * s_atr + 0.35 * s_bb + 0.35 * s_contr);
    result.available = true;
    result.features = std::move(debug);
    return result;
}

double VolatilityScorer::inverseScaleScore(double x, double scale) {
    if (std::isnan(x) || scale <= 0.0) return 0.0;
    if (x < 0.0) x = 0.0;
    return TechnicalIndicators::clamp(100.0 / (1.0 + x / scale));
}

double VolatilityScorer::contractionRatioScore(double ratio) {
    if (std::isnan(ratio)) return 0.0;
    if (ratio <= 0.0) return 100.0;
    if (ratio >= 2.0) return 0.0;
    return TechnicalIndicators::clamp((2.0 - ratio) / 2.0 * 100.0);
}

} // namespace scoring
} // namespace confluence
