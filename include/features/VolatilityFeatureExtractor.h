#pragma once

#include <vector>
#include "common/Types.h"
#include "features/FeatureTypes.h"

namespace confluence {
namespace features {

// ATR%, Bollinger width and the 60/20 contraction ratio. Needs kVolatilityMinBars bars.
class VolatilityFeatureExtractor {
public:
    static VolatilityFeatures extract(const std::vector<Bar>& bars);

    // recent ATR% / earlier ATR% on disjoint windows. 1.0 when undefined.
    static double contractionRatio(const std::vector<Bar>& bars, int window_long = 60, int window_short = 20);
};

} // namespace features
} // namespace confluence
