#include "features/VolatilityFeatureExtractor.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace confluence {
namespace features {

using analytics::TechnicalIndicators;

VolatilityFeatures VolatilityFeatureExtractor::extract(const std::vector<Bar>& bars) {
    VolatilityFeatures out;
    if (bars.size() < kVolatilityMinBars) {
        return out;
    }

    out.atr_pct_14 = TechnicalIndicators::calculateATRPercent(bars, 14);
    out.bb_width_pct_20 = TechnicalIndicators::calculateBollingerBands(
        TechnicalIndicators::extractClosePrices(bars), 20, 2.0).width_pct;
    out.contraction_ratio_60_20 = contractionRatio(bars, 60, 20);
    out.has_data = true;
    return out;
}

double VolatilityFeatureExtractor::contractionRatio(const std::vector<Bar>& bars, int window_long, int window_short) {
    if (window_long <= 0 || window_short <= 0 ||
        bars.size() < static_cast<size_t>(window_long + window_short)) {
        return 1.0;
    }

    // earlier: window_long bars ending window_short bars ago
    // recent: last window_short changes (window_short + 1 bars)
    const auto earlier_begin = bars.end() - (window_long + window_short);
    const std::vector<Bar> earlier(earlier_begin, earlier_begin + window_long);
    const std::vector<Bar> recent(bars.end() - (window_short + 1), bars.end());

    const int earlier_period = std::min(14, static_cast<int>(earlier.size()) - 1);
    const int recent_period = std::min(14, static_cast<int>(recent.size()) - 1);

    const double earlier_atr_pct = TechnicalIndicators::calculateATRPercent(earlier, earlier_period);
    const double recent_atr_pct = TechnicalIndicators::calculateATRPercent(recent, recent_period);

    if (earlier_atr_pct <= 0.0) {
        return 1.0;
    }
    return recent_atr_pct / earlier_atr_pct;
}

} // namespace features
} // namespace confluence
