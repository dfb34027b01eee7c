#pragma once

#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace scoring {

// Per horizon the cross-sectional rank is used when present, otherwise the
// raw return mapped through returnScore(). Horizon weights 20/60/120 bars =
// .45/.35/.20, renormalised over the available horizons.
class RelativeStrengthScorer {
public:
    static ScoreResult score(const features::RsFeatures& features);

    // <= -50% -> 0, >= 150% -> 100, linear between
    static double returnScore(double ret_pct, double neg_cap = -50.0, double pos_cap = 150.0);
    static double horizonWeight(int bars);
};

} // namespace scoring
} // namespace confluence
