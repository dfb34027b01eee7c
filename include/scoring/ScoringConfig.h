#pragma once

#include <map>
#include "common/Types.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace scoring {

// regimes.* thresholds
struct RegimeThresholds {
    double bull_min_risk_on = 65.0;
    double bull_min_breadth = 60.0;
    double bull_min_trend = 60.0;

    double bear_max_risk_on = 35.0;
    double bear_max_breadth = 40.0;
    double bear_max_trend = 40.0;
};

// confluence.* weighting
struct ConfluenceConfig {
    MarketRegime default_regime = MarketRegime::SIDEWAYS;
    // Regimes without an entry fall back to equal weights
    std::map<MarketRegime, WeightTable> regime_weights;
};

} // namespace scoring
} // namespace confluence
