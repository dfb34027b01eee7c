#pragma once

#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace scoring {

// Funding crowding .7, open-interest build-up .3
class PositioningScorer {
public:
    static ScoreResult score(const features::PositioningFeatures& features);

    // |funding| in percent: <=0.01 -> 100, 0.05 -> 70, 0.10 -> 40, >=0.20 -> 10,
    // linear between the knots
    static double fundingCrowdingScore(double funding_rate);
    // -100%..+100% -> 0..100
    static double oiBuildUpScore(double oi_change_pct);
};

} // namespace scoring
} // namespace confluence
