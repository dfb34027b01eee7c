#pragma once

#include <vector>
#include "pattern/IPatternDetector.h"
#include "pattern/PatternConfig.h"

namespace confluence {
namespace pattern {

// Regular RSI divergence on the two most recent pivots.
//   bullish: price makes a lower low while RSI makes a higher low
//   bearish: price makes a higher high while RSI makes a lower high
// Only fires when the latest price pivot sits within max_bars_from_last of
// the last bar. Holds no state between calls.
class RsiDivergenceDetector : public IPatternDetector {
public:
    explicit RsiDivergenceDetector(const RsiDivergenceParams& params = RsiDivergenceParams());

    std::string name() const override { return "rsi_divergence"; }
    std::optional<PatternSignal> detect(const PatternContext& ctx) const override;

    // Bars-only entry point for callers without features or scores
    std::optional<PatternSignal> detectFromBars(const std::string& symbol,
                                                const std::string& timeframe,
                                                const std::vector<Bar>& bars) const;

    const RsiDivergenceParams& params() const { return params_; }

private:
    PatternSignal buildSignal(const PatternContext& ctx,
                              const std::vector<Bar>& window,
                              SignalDirection direction,
                              size_t p1, size_t p2,
                              size_t r1, size_t r2,
                              const std::vector<double>& prices,
                              const std::vector<double>& rsi) const;

    RsiDivergenceParams params_;
};

} // namespace pattern
} // namespace confluence
