#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"
#include "pattern/PatternTypes.h"

namespace confluence {
namespace pipeline {

// Everything the scan knows about one symbol on one timeframe
struct ScoreBundle {
    std::string symbol;
    std::string timeframe;
    features::FeatureBundle features;
    scoring::ComponentScores scores;

    double confluence_score = 0.0;
    double confidence = 0.0;
    MarketRegime regime = MarketRegime::SIDEWAYS;
    scoring::WeightTable weights;

    std::vector<std::string> pattern_labels;
    std::vector<pattern::PatternSignal> pattern_signals;

    bool hasPattern(const std::string& name) const;

    // Component debug maps merged under "<component>.<key>"
    std::map<std::string, double> debugFeatures() const;

    nlohmann::json toJson() const;
};

} // namespace pipeline
} // namespace confluence
