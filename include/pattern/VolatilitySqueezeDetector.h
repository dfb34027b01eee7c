#pragma once

#include "pattern/IPatternDetector.h"
#include "pattern/PatternConfig.h"

namespace confluence {
namespace pattern {

// Narrow Bollinger bands with contracting ATR. Directionless.
class VolatilitySqueezeDetector : public IPatternDetector {
public:
    explicit VolatilitySqueezeDetector(const VolatilitySqueezeParams& params = VolatilitySqueezeParams());

    std::string name() const override { return "volatility_squeeze"; }
    std::optional<PatternSignal> detect(const PatternContext& ctx) const override;

    const VolatilitySqueezeParams& params() const { return params_; }

private:
    VolatilitySqueezeParams params_;
};

} // namespace pattern
} // namespace confluence
