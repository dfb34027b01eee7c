#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Types.h"
#include "scoring/ScoringConfig.h"

namespace confluence {
namespace analytics {

// Market-wide snapshot: benchmark trend and volatility scores, breadth,
// average positioning and the risk-on index, then the regime label.
class MarketHealthAnalyzer {
public:
    MarketHealthAnalyzer(const std::string& benchmark_symbol,
                         const scoring::RegimeThresholds& thresholds = scoring::RegimeThresholds());

    // `universe` fixes the symbol order; the benchmark falls back to its
    // first entry when the configured symbol is not part of it.
    MarketHealth analyze(const std::vector<std::string>& universe,
                         const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
                         const std::map<std::string, DerivativesMetrics>& derivatives_by_symbol) const;

    // 0.40 trend + 0.30 breadth + 0.15 volatility comfort + 0.15 positioning
    static double riskOnIndex(double benchmark_trend, double breadth_pct,
                              double benchmark_volatility, double avg_positioning);

    // 100 - 2 * |volatility score - 50|
    static double volatilityComfort(double volatility_score);

    std::string resolveBenchmark(const std::vector<std::string>& universe) const;

private:
    std::string benchmark_symbol_;
    scoring::RegimeThresholds thresholds_;
};

} // namespace analytics
} // namespace confluence
