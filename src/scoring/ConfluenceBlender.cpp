#include "scoring/ConfluenceBlender.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace confluence {
namespace scoring {

ConfluenceBlender::ConfluenceBlender(const ConfluenceConfig& config)
    : config_(config) {}

WeightTable ConfluenceBlender::resolveWeights(MarketRegime regime) const {
    auto it = config_.regime_weights.find(regime);
    if (it != config_.regime_weights.end() && !it->second.empty()) {
        return it->second;
    }

    if (fallback_logged_.insert(regime).second) {
        LOG_WARN("No confluence weights configured for regime '{}', using equal weights",
                 regimeToString(regime));
    }
    return equalWeights();
}

ConfluenceResult ConfluenceBlender::blend(const ComponentScores& scores,
                                          std::optional<MarketRegime> regime,
                                          const WeightTable* explicit_weights) const {
    std::map<ScoreComponent, double> values;
    std::map<ScoreComponent, bool> availability;
    for (auto component : allComponents()) {
        const ScoreResult& result = scores.get(component);
        values[component] = result.score;
        availability[component] = result.available;
    }
    return blend(values, availability, regime, explicit_weights);
}

ConfluenceResult ConfluenceBlender::blend(const std::map<ScoreComponent, double>& values,
                                          const std::map<ScoreComponent, bool>& availability,
                                          std::optional<MarketRegime> regime,
                                          const WeightTable* explicit_weights) const {
    ConfluenceResult result;
    result.regime = regime.value_or(config_.default_regime);
    result.weights = explicit_weights ? *explicit_weights : resolveWeights(result.regime);

    if (result.weights.empty()) {
        return result;
    }

    double weighted = 0.0;
    double used_weight = 0.0;
    double total_weight = 0.0;

    for (const auto& [component, w] : result.weights) {
        if (!std::isfinite(w) || w <= 0.0) {
            continue;
        }
        total_weight += w;

        auto flag = availability.find(component);
        if (flag != availability.end() && !flag->second) {
            continue;
        }
        auto value = values.find(component);
        if (value == values.end() || !std::isfinite(value->second)) {
            continue;
        }

        weighted += w * value->second;
        used_weight += w;
    }

    const double raw = used_weight != 0.0 ? weighted / used_weight : 0.0;
    result.score = std::isfinite(raw) ? std::max(0.0, std::min(100.0, raw)) : 0.0;
    result.confidence = total_weight > 0.0
        ? std::max(0.0, std::min(100.0, used_weight / total_weight * 100.0))
        : 0.0;
    return result;
}

} // namespace scoring
} // namespace confluence
