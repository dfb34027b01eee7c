#pragma once

#include <vector>
#include "common/Types.h"
#include "features/FeatureTypes.h"

namespace confluence {
namespace features {

// SMA20/SMA50 trend features. Needs kTrendMinBars bars.
class TrendFeatureExtractor {
public:
    static TrendFeatures extract(const std::vector<Bar>& bars);

    static double maAlignment(const std::vector<double>& closes, int short_period = 20, int long_period = 50);
    static double persistence(const std::vector<double>& closes, int lookback = 20);
    static double distanceFromMa(const std::vector<double>& closes, int ma_period = 50);
};

} // namespace features
} // namespace confluence
