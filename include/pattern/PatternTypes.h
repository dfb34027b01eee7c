#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "features/FeatureTypes.h"
#include "scoring/ScoreResult.h"

namespace confluence {
namespace pattern {

enum class SignalDirection {
    NONE,
    BULLISH,
    BEARISH
};

std::string directionToString(SignalDirection direction);

struct PatternSignal {
    std::string pattern_name;
    std::string symbol;
    std::string timeframe;
    bool triggered = false;
    SignalDirection direction = SignalDirection::NONE;
    double strength = 0.0;      // 0..100
    double confidence = 0.0;    // 0..100
    std::string note;
    nlohmann::json extras = nlohmann::json::object();

    nlohmann::json toJson() const;
};

// Everything a detector may look at for one symbol. Holds references only;
// the caller keeps the referenced data alive for the duration of detect().
struct PatternContext {
    const std::string& symbol;
    const std::string& timeframe;
    const std::vector<Bar>& bars;
    const features::FeatureBundle& features;
    const scoring::ComponentScores& scores;
    std::optional<double> confluence_score;
    std::optional<MarketRegime> regime;

    PatternContext(const std::string& symbol_,
                   const std::string& timeframe_,
                   const std::vector<Bar>& bars_,
                   const features::FeatureBundle& features_,
                   const scoring::ComponentScores& scores_,
                   std::optional<double> confluence_score_ = std::nullopt,
                   std::optional<MarketRegime> regime_ = std::nullopt)
        : symbol(symbol_)
        , timeframe(timeframe_)
        , bars(bars_)
        , features(features_)
        , scores(scores_)
        , confluence_score(confluence_score_)
        , regime(regime_)
    {}
};

} // namespace pattern
} // namespace confluence
