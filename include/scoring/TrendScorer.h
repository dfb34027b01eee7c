#pragma once

#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace scoring {

// alignment .35, persistence .30, extension .20, MA slope .15
class TrendScorer {
public:
    static ScoreResult score(const features::TrendFeatures& features);

    static double alignmentScore(double alignment);
    static double persistenceScore(double persistence);
    static double extensionScore(double distance_pct, double ideal_band = 5.0);
    static double slopeScore(double slope_pct, double max_abs = 5.0);
};

} // namespace scoring
} // namespace confluence
