#pragma once

#include "pattern/IPatternDetector.h"
#include "pattern/PatternConfig.h"

namespace confluence {
namespace pattern {

// Close beyond the prior `lookback` range on elevated relative volume,
// gated by trend/volume/rs/confluence floors. Bearish breakdowns are
// opt-in through allow_bearish.
class BreakoutDetector : public IPatternDetector {
public:
    explicit BreakoutDetector(const BreakoutParams& params = BreakoutParams());

    std::string name() const override { return "breakout"; }
    std::optional<PatternSignal> detect(const PatternContext& ctx) const override;

    const BreakoutParams& params() const { return params_; }

private:
    PatternSignal buildSignal(const PatternContext& ctx,
                              SignalDirection direction,
                              double pivot_price,
                              double breakout_pct,
                              double rvol) const;

    BreakoutParams params_;
};

} // namespace pattern
} // namespace confluence
