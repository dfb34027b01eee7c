#pragma once

#include "common/Types.h"
#include "scoring/ScoringConfig.h"

namespace confluence {
namespace scoring {

// bull: risk-on, breadth and trend all at or above the bull floors
// bear: all three at or below the bear ceilings
// sideways otherwise; unknown only when no metric is present at all
class RegimeClassifier {
public:
    explicit RegimeClassifier(const RegimeThresholds& thresholds = RegimeThresholds());

    MarketRegime classify(const MarketHealth& health) const;

    const RegimeThresholds& thresholds() const { return thresholds_; }

private:
    RegimeThresholds thresholds_;
};

} // namespace scoring
} // namespace confluence
