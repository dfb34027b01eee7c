#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace confluence {
namespace scoring {

constexpr double kNeutralScore = 50.0;

// Output of every score normalizer. `features` keeps raw inputs and the
// intermediate component scores so a score can be audited.
struct ScoreResult {
    double score = kNeutralScore;
    bool available = false;
    std::map<std::string, double> features;
};

enum class ScoreComponent {
    TREND,
    VOLUME,
    VOLATILITY,
    RS,
    POSITIONING
};

using WeightTable = std::map<ScoreComponent, double>;

const std::vector<ScoreComponent>& allComponents();

// Canonical key, e.g. "trend_score"
std::string componentKey(ScoreComponent component);

// Accepts "trend" and "trend_score" style names
std::optional<ScoreComponent> componentFromAlias(const std::string& name);

// Equal weights over the five canonical components
WeightTable equalWeights();

// Clamp to [0,100]; non-finite values become the neutral score
double sanitizeScore(double raw);

// Neutral result that still carries the raw inputs
ScoreResult neutralResult(std::map<std::string, double> raw_features);

struct ComponentScores {
    ScoreResult trend;
    ScoreResult volume;
    ScoreResult volatility;
    ScoreResult rs;
    ScoreResult positioning;

    const ScoreResult& get(ScoreComponent component) const;
    double value(ScoreComponent component) const { return get(component).score; }

    // {"trend_score": .., "volume_score": .., ...}
    std::map<std::string, double> toMap() const;
};

} // namespace scoring
} // namespace confluence
