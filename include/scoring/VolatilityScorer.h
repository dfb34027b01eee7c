#pragma once

#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace scoring {

// Quiet, compressed markets score high.
class VolatilityScorer {
public:
    static ScoreResult score(const features::VolatilityFeatures& features);

    // 100 / (1 + x / scale)
    static double inverseScaleScore(double x, double scale);
    // 100 at ratio <= 0, linear down to 0 at ratio >= 2
    static double contractionRatioScore(double ratio);
};

} // namespace scoring
} // namespace confluence
