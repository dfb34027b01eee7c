#pragma once

#include <memory>
#include <string>
#include <vector>
#include "pattern/IPatternDetector.h"
#include "pattern/PatternConfig.h"

namespace confluence {
namespace pattern {

// Named detectors in registration order, filtered by patterns.enabled.
class PatternRegistry {
public:
    PatternRegistry() = default;

    // breakout, pullback, volatility_squeeze, rsi_divergence with the
    // configured parameter blocks and enabled list
    static PatternRegistry createDefault(const PatternsConfig& config);

    // A detector registered under an existing name replaces it
    void registerDetector(std::shared_ptr<IPatternDetector> detector);
    std::shared_ptr<IPatternDetector> getDetector(const std::string& name) const;

    // Empty list enables every registered detector
    void setEnabled(const std::vector<std::string>& enabled) { enabled_ = enabled; }
    bool isEnabled(const std::string& name) const;

    std::vector<std::string> registeredNames() const;
    std::vector<std::string> enabledNames() const;
    std::vector<std::shared_ptr<IPatternDetector>> enabledDetectors() const;

    // Runs every enabled detector; a failing detector is logged and skipped
    std::vector<PatternSignal> detectAll(const PatternContext& ctx) const;

private:
    std::vector<std::shared_ptr<IPatternDetector>> detectors_;
    std::vector<std::string> enabled_;
};

} // namespace pattern
} // namespace confluence
