#include "features/RelativeStrengthFeatureExtractor.h"
#include "analytics/TechnicalIndicators.h"

#include <cmath>

namespace confluence {
namespace features {

using analytics::TechnicalIndicators;

RsFeatures RelativeStrengthFeatureExtractor::extract(
    const std::string& symbol,
    const std::vector<Bar>& bars,
    const UniverseReturns* universe,
    const std::vector<int>& horizons
) {
    RsFeatures out;
    for (int h : horizons) {
        RsHorizon horizon;
        horizon.bars = h;
        out.horizons.push_back(horizon);
    }

    if (bars.size() < kRelativeStrengthMinBars) {
        return out;
    }

    const std::map<int, double>* own = nullptr;
    if (universe) {
        auto it = universe->find(symbol);
        if (it != universe->end()) {
            own = &it->second;
        }
    }

    for (auto& horizon : out.horizons) {
        if (horizon.bars <= 0 || bars.size() <= static_cast<size_t>(horizon.bars)) {
            continue;
        }
        horizon.available = true;
        horizon.return_pct = returnPct(bars, horizon.bars);

        if (!own) continue;
        auto own_it = own->find(horizon.bars);
        if (own_it == own->end() || !std::isfinite(own_it->second)) continue;
        horizon.return_pct = own_it->second;

        std::vector<double> population;
        population.reserve(universe->size());
        for (const auto& [other, returns] : *universe) {
            auto r = returns.find(horizon.bars);
            if (r != returns.end() && std::isfinite(r->second)) {
                population.push_back(r->second);
            }
        }
        if (!population.empty()) {
            horizon.rank_pct = TechnicalIndicators::percentileRank(horizon.return_pct, population);
        }
    }

    out.has_data = true;
    return out;
}

double RelativeStrengthFeatureExtractor::returnPct(const std::vector<Bar>& bars, int lookback) {
    if (lookback <= 0 || bars.size() <= static_cast<size_t>(lookback)) {
        return 0.0;
    }
    const double past = bars[bars.size() - 1 - lookback].close;
    if (past == 0.0) {
        return 0.0;
    }
    return (bars.back().close / past - 1.0) * 100.0;
}

UniverseReturns RelativeStrengthFeatureExtractor::computeUniverseReturns(
    const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
    const std::vector<int>& horizons
) {
    UniverseReturns universe;
    for (const auto& [symbol, bars] : bars_by_symbol) {
        if (bars.size() < kRelativeStrengthMinBars) {
            continue;
        }
        auto& returns = universe[symbol];
        for (int h : horizons) {
            if (h > 0 && bars.size() > static_cast<size_t>(h)) {
                returns[h] = returnPct(bars, h);
            }
        }
    }
    return universe;
}

} // namespace features
} // namespace confluence
