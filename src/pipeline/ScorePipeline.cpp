#include "pipeline/ScorePipeline.h"
#include "common/Logger.h"
#include "features/TrendFeatureExtractor.h"
#include "features/VolatilityFeatureExtractor.h"
#include "features/VolumeFeatureExtractor.h"
#include "features/RelativeStrengthFeatureExtractor.h"
#include "features/PositioningFeatureExtractor.h"
#include "scoring/TrendScorer.h"
#include "scoring/VolatilityScorer.h"
#include "scoring/VolumeScorer.h"
#include "scoring/RelativeStrengthScorer.h"
#include "scoring/PositioningScorer.h"

namespace confluence {
namespace pipeline {

ScorePipeline::ScorePipeline(const scoring::ConfluenceBlender& blender,
                             const pattern::PatternRegistry* patterns)
    : blender_(blender)
    , patterns_(patterns)
{
}

features::FeatureBundle ScorePipeline::computeFeatures(
    const std::string& symbol,
    const std::vector<Bar>& bars,
    const features::UniverseReturns* universe,
    const std::optional<DerivativesMetrics>& derivatives
) {
    features::FeatureBundle bundle;
    bundle.trend = features::TrendFeatureExtractor::extract(bars);
    bundle.volatility = features::VolatilityFeatureExtractor::extract(bars);
    bundle.volume = features::VolumeFeatureExtractor::extract(bars);
    bundle.rs = features::RelativeStrengthFeatureExtractor::extract(symbol, bars, universe);
    bundle.positioning = features::PositioningFeatureExtractor::extract(derivatives);
    return bundle;
}

scoring::ComponentScores ScorePipeline::computeScores(const features::FeatureBundle& features) {
    scoring::ComponentScores scores;
    scores.trend = scoring::TrendScorer::score(features.trend);
    scores.volume = scoring::VolumeScorer::score(features.volume);
    scores.volatility = scoring::VolatilityScorer::score(features.volatility);
    scores.rs = scoring::RelativeStrengthScorer::score(features.rs);
    scores.positioning = scoring::PositioningScorer::score(features.positioning);
    return scores;
}

ScoreBundle ScorePipeline::buildBundle(
    const std::string& symbol,
    const std::string& timeframe,
    const std::vector<Bar>& bars,
    const features::UniverseReturns* universe,
    const std::optional<DerivativesMetrics>& derivatives,
    std::optional<MarketRegime> regime,
    const scoring::WeightTable* weights
) const {
    ScoreBundle bundle;
    bundle.symbol = symbol;
    bundle.timeframe = timeframe;
    bundle.features = computeFeatures(symbol, bars, universe, derivatives);
    bundle.scores = computeScores(bundle.features);

    const auto confluence = blender_.blend(bundle.scores, regime, weights);
    bundle.confluence_score = confluence.score;
    bundle.confidence = confluence.confidence;
    bundle.regime = confluence.regime;
    bundle.weights = confluence.weights;

    if (patterns_) {
        pattern::PatternContext ctx(symbol, timeframe, bars, bundle.features, bundle.scores,
                                    bundle.confluence_score, bundle.regime);
        bundle.pattern_signals = patterns_->detectAll(ctx);
        for (const auto& signal : bundle.pattern_signals) {
            bundle.pattern_labels.push_back(signal.pattern_name);
        }
    }

    LOG_DEBUG("{} {} CS {:.1f} (confidence {:.0f}%, patterns {})",
              symbol, timeframe, bundle.confluence_score, bundle.confidence,
              bundle.pattern_labels.size());
    return bundle;
}

std::vector<ScoreBundle> ScorePipeline::buildBundles(
    const std::vector<std::string>& symbols,
    const std::string& timeframe,
    const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
    const std::map<std::string, DerivativesMetrics>& derivatives_by_symbol,
    std::optional<MarketRegime> regime
) const {
    const auto universe =
        features::RelativeStrengthFeatureExtractor::computeUniverseReturns(bars_by_symbol);

    std::vector<ScoreBundle> bundles;
    bundles.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        auto it = bars_by_symbol.find(symbol);
        if (it == bars_by_symbol.end() || it->second.empty()) {
            LOG_WARN("No bars for {}, skipping", symbol);
            continue;
        }

        std::optional<DerivativesMetrics> derivatives;
        auto d = derivatives_by_symbol.find(symbol);
        if (d != derivatives_by_symbol.end()) {
            derivatives = d->second;
        }

        bundles.push_back(buildBundle(symbol, timeframe, it->second, &universe, derivatives, regime));
    }
    return bundles;
}

} // namespace pipeline
} // namespace confluence
