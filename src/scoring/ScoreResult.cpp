#include "scoring/ScoreResult.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace confluence {
namespace scoring {

const std::vector<ScoreComponent>& allComponents() {
    static const std::vector<ScoreComponent> components = {
        ScoreComponent::TREND,
        ScoreComponent::VOLUME,
        ScoreComponent::VOLATILITY,
        ScoreComponent::RS,
        ScoreComponent::POSITIONING
    };
    return components;
}

std::string componentKey(ScoreComponent component) {
    switch (component) {
        case ScoreComponent::TREND: return "trend_score";
        case ScoreComponent::VOLUME: return "volume_score";
        case ScoreComponent::VOLATILITY: return "volatility_score";
        case ScoreComponent::RS: return "rs_score";
        case ScoreComponent::POSITIONING: return "positioning_score";
    }
    return "unknown_score";
}

std::optional<ScoreComponent> componentFromAlias(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string suffix = "_score";
    if (key.size() > suffix.size() &&
        key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
        key.erase(key.size() - suffix.size());
    }

    if (key == "trend") return ScoreComponent::TREND;
    if (key == "volume") return ScoreComponent::VOLUME;
    if (key == "volatility") return ScoreComponent::VOLATILITY;
    if (key == "rs") return ScoreComponent::RS;
    if (key == "positioning") return ScoreComponent::POSITIONING;
    return std::nullopt;
}

WeightTable equalWeights() {
    WeightTable weights;
    const double equal = 1.0 / static_cast<double>(allComponents().size());
    for (auto component : allComponents()) {
        weights[component] = equal;
    }
    return weights;
}

double sanitizeScore(double raw) {
    if (!std::isfinite(raw)) {
        return kNeutralScore;
    }
    return std::max(0.0, std::min(100.0, raw));
}

ScoreResult neutralResult(std::map<std::string, double> raw_features) {
    ScoreResult result;
    result.score = kNeutralScore;
    result.available = false;
    result.features = std::move(raw_features);
    return result;
}

const ScoreResult& ComponentScores::get(ScoreComponent component) const {
    switch (component) {
        case ScoreComponent::TREND: return trend;
        case ScoreComponent::VOLUME: return volume;
        case ScoreComponent::VOLATILITY: return volatility;
        case ScoreComponent::RS: return rs;
        case ScoreComponent::POSITIONING: return positioning;
    }
    return trend;
}

std::map<std::string, double> ComponentScores::toMap() const {
    std::map<std::string, double> out;
    for (auto component : allComponents()) {
        out[componentKey(component)] = get(component).score;
    }
    return out;
}

} // namespace scoring
} // namespace confluence
