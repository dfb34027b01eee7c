#pragma once

#include <map>
#include <optional>
#include <set>
#include "common/Types.h"
#include "scoring/ScoreResult.h"
#include "scoring/ScoringConfig.h"

namespace confluence {
namespace scoring {

struct ConfluenceResult {
    double score = 0.0;        // 0..100
    double confidence = 0.0;   // used weight / total weight * 100
    MarketRegime regime = MarketRegime::SIDEWAYS;
    WeightTable weights;       // weights actually applied
};

// Availability-aware weighted average of the component scores. Weights come
// from the explicit argument, else confluence.regime_weights.<regime>, else
// equal weights over the five components.
class ConfluenceBlender {
public:
    explicit ConfluenceBlender(const ConfluenceConfig& config = ConfluenceConfig());

    ConfluenceResult blend(const ComponentScores& scores,
                           std::optional<MarketRegime> regime = std::nullopt,
                           const WeightTable* explicit_weights = nullptr) const;

    // Components without an availability entry count as available
    ConfluenceResult blend(const std::map<ScoreComponent, double>& values,
                           const std::map<ScoreComponent, bool>& availability,
                           std::optional<MarketRegime> regime = std::nullopt,
                           const WeightTable* explicit_weights = nullptr) const;

    WeightTable resolveWeights(MarketRegime regime) const;

private:
    ConfluenceConfig config_;
    mutable std::set<MarketRegime> fallback_logged_;
};

} // namespace scoring
} // namespace confluence
