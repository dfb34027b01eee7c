#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "features/FeatureTypes.h"
#include "pattern/PatternRegistry.h"
#include "pipeline/ScoreBundle.h"
#include "scoring/ConfluenceBlender.h"

namespace confluence {
namespace pipeline {

// bars (+ universe returns, derivatives) -> features -> scores -> confluence
// -> pattern labels. Pure apart from logging.
class ScorePipeline {
public:
    // `patterns` may be null to skip pattern detection
    ScorePipeline(const scoring::ConfluenceBlender& blender,
                  const pattern::PatternRegistry* patterns = nullptr);

    static features::FeatureBundle computeFeatures(
        const std::string& symbol,
        const std::vector<Bar>& bars,
        const features::UniverseReturns* universe,
        const std::optional<DerivativesMetrics>& derivatives);

    static scoring::ComponentScores computeScores(const features::FeatureBundle& features);

    ScoreBundle buildBundle(const std::string& symbol,
                            const std::string& timeframe,
                            const std::vector<Bar>& bars,
                            const features::UniverseReturns* universe = nullptr,
                            const std::optional<DerivativesMetrics>& derivatives = std::nullopt,
                            std::optional<MarketRegime> regime = std::nullopt,
                            const scoring::WeightTable* weights = nullptr) const;

    // Universe returns are computed once from `bars_by_symbol`. Symbols
    // without bars are skipped.
    std::vector<ScoreBundle> buildBundles(
        const std::vector<std::string>& symbols,
        const std::string& timeframe,
        const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
        const std::map<std::string, DerivativesMetrics>& derivatives_by_symbol,
        std::optional<MarketRegime> regime = std::nullopt) const;

private:
    const scoring::ConfluenceBlender& blender_;
    const pattern::PatternRegistry* patterns_;
};

} // namespace pipeline
} // namespace confluence
