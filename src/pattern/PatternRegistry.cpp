#include "pattern/PatternRegistry.h"
#include "pattern/BreakoutDetector.h"
#include "pattern/PullbackDetector.h"
#include "pattern/VolatilitySqueezeDetector.h"
#include "pattern/RsiDivergenceDetector.h"
#include "common/Logger.h"
#include <algorithm>
#include <exception>
#include <utility>

namespace confluence {
namespace pattern {

PatternRegistry PatternRegistry::createDefault(const PatternsConfig& config) {
    PatternRegistry registry;
    registry.registerDetector(std::make_shared<BreakoutDetector>(config.breakout));
    registry.registerDetector(std::make_shared<PullbackDetector>(config.pullback));
    registry.registerDetector(std::make_shared<VolatilitySqueezeDetector>(config.volatility_squeeze));
    registry.registerDetector(std::make_shared<RsiDivergenceDetector>(config.rsi_divergence));
    registry.setEnabled(config.enabled);
    return registry;
}

void PatternRegistry::registerDetector(std::shared_ptr<IPatternDetector> detector) {
    if (!detector) {
        return;
    }
    const std::string name = detector->name();
    for (auto& existing : detectors_) {
        if (existing->name() == name) {
            existing = detector;
            LOG_INFO("Pattern detector replaced: {}", name);
            return;
        }
    }
    detectors_.push_back(detector);
    LOG_DEBUG("Pattern detector registered: {}", name);
}

std::shared_ptr<IPatternDetector> PatternRegistry::getDetector(const std::string& name) const {
    for (const auto& detector : detectors_) {
        if (detector->name() == name) {
            return detector;
        }
    }
    return nullptr;
}

bool PatternRegistry::isEnabled(const std::string& name) const {
    if (enabled_.empty()) {
        return true;
    }
    return std::find(enabled_.begin(), enabled_.end(), name) != enabled_.end();
}

std::vector<std::string> PatternRegistry::registeredNames() const {
    std::vector<std::string> names;
    for (const auto& detector : detectors_) {
        names.push_back(detector->name());
    }
    return names;
}

std::vector<std::string> PatternRegistry::enabledNames() const {
    std::vector<std::string> names;
    for (const auto& detector : enabledDetectors()) {
        names.push_back(detector->name());
    }
    return names;
}

std::vector<std::shared_ptr<IPatternDetector>> PatternRegistry::enabledDetectors() const {
    std::vector<std::shared_ptr<IPatternDetector>> out;
    for (const auto& detector : detectors_) {
        if (isEnabled(detector->name())) {
            out.push_back(detector);
        }
    }
    return out;
}

std::vector<PatternSignal> PatternRegistry::detectAll(const PatternContext& ctx) const {
    std::vector<PatternSignal> signals;
    for (const auto& detector : enabledDetectors()) {
        try {
            auto signal = detector->detect(ctx);
            if (signal && signal->triggered) {
                signals.push_back(std::move(*signal));
            }
        } catch (const std::exception& e) {
            LOG_WARN("Pattern {} failed for {}: {}", detector->name(), ctx.symbol, e.what());
        }
    }
    return signals;
}

} // namespace pattern
} // namespace confluence
