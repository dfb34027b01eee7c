#pragma once

#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace scoring {

// RVOL .45, volume MA slope .25, volume percentile .30
class VolumeScorer {
public:
    static ScoreResult score(const features::VolumeFeatures& features);

    // 0-60 under 1x, 60-80 for 1-1.5x, 80-100 for 1.5-3x,
    // 100 -> 70 for 3-7x, 70 beyond
    static double rvolScore(double rvol, double ideal_low = 1.5, double ideal_high = 3.0);
    static double slopeScore(double slope_pct, double max_abs = 20.0);
    static double percentileScore(double percentile);
};

} // namespace scoring
} // namespace confluence
