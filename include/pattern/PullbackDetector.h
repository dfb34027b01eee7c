#pragma once

#include "pattern/IPatternDetector.h"
#include "pattern/PatternConfig.h"

namespace confluence {
namespace pattern {

// Orderly dip inside an established uptrend: price off its recent high by
// a bounded amount, close to the trend MA, on quiet volume.
class PullbackDetector : public IPatternDetector {
public:
    explicit PullbackDetector(const PullbackParams& params = PullbackParams());

    std::string name() const override { return "pullback"; }
    std::optional<PatternSignal> detect(const PatternContext& ctx) const override;

    const PullbackParams& params() const { return params_; }

private:
    // RSI over the last 30 closes; nullopt when too short
    std::optional<double> recentRsi(const std::vector<Bar>& bars) const;

    PullbackParams params_;
};

} // namespace pattern
} // namespace confluence
