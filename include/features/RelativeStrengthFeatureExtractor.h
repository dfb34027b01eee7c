#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Types.h"
#include "features/FeatureTypes.h"

namespace confluence {
namespace features {

class RelativeStrengthFeatureExtractor {
public:
    // Multi-horizon returns, ranked against `universe` when it holds this symbol.
    static RsFeatures extract(const std::string& symbol,
                              const std::vector<Bar>& bars,
                              const UniverseReturns* universe = nullptr,
                              const std::vector<int>& horizons = defaultRsHorizons());

    // (last / close `lookback` bars ago - 1) * 100. 0 without enough history.
    static double returnPct(const std::vector<Bar>& bars, int lookback);

    // Raw returns of every symbol with at least kRelativeStrengthMinBars bars.
    // Horizons longer than a symbol's history are left out for that symbol.
    static UniverseReturns computeUniverseReturns(
        const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
        const std::vector<int>& horizons = defaultRsHorizons());
};

} // namespace features
} // namespace confluence
