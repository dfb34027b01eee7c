#include "analytics/MarketHealthAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "features/PositioningFeatureExtractor.h"
#include "features/TrendFeatureExtractor.h"
#include "features/VolatilityFeatureExtractor.h"
#include "scoring/PositioningScorer.h"
#include "scoring/RegimeClassifier.h"
#include "scoring/TrendScorer.h"
#include "scoring/VolatilityScorer.h"

#include <algorithm>
#include <cmath>

namespace confluence {
namespace analytics {

namespace {
constexpr double kUptrendScore = 60.0;
}

MarketHealthAnalyzer::MarketHealthAnalyzer(const std::string& benchmark_symbol,
                                           const scoring::RegimeThresholds& thresholds)
    : benchmark_symbol_(benchmark_symbol), thresholds_(thresholds) {}

std::string MarketHealthAnalyzer::resolveBenchmark(const std::vector<std::string>& universe) const {
    if (universe.empty()) return "";
    if (std::find(universe.begin(), universe.end(), benchmark_symbol_) != universe.end()) {
        return benchmark_symbol_;
    }
    return universe.front();
}

MarketHealth MarketHealthAnalyzer::analyze(
    const std::vector<std::string>& universe,
    const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
    const std::map<std::string, DerivativesMetrics>& derivatives_by_symbol
) const {
    MarketHealth health;
    if (universe.empty()) {
        return health;
    }

    const std::string benchmark = resolveBenchmark(universe);
    double bench_trend = scoring::kNeutralScore;
    double bench_vol = scoring::kNeutralScore;

    auto bench_it = bars_by_symbol.find(benchmark);
    if (bench_it != bars_by_symbol.end() && !bench_it->second.empty()) {
        bench_trend = scoring::TrendScorer::score(
            features::TrendFeatureExtractor::extract(bench_it->second)).score;
        bench_vol = scoring::VolatilityScorer::score(
            features::VolatilityFeatureExtractor::extract(bench_it->second)).score;
    } else {
        LOG_WARN("Benchmark {} has no bars, using neutral trend/volatility", benchmark);
    }

    int trend_valid = 0;
    int uptrend_count = 0;
    std::vector<double> positioning_scores;

    for (const auto& symbol : universe) {
        auto it = bars_by_symbol.find(symbol);
        if (it == bars_by_symbol.end() || it->second.empty()) {
            continue;
        }

        const double trend = scoring::TrendScorer::score(
            features::TrendFeatureExtractor::extract(it->second)).score;
        ++trend_valid;
        if (trend >= kUptrendScore) {
            ++uptrend_count;
        }

        std::optional<DerivativesMetrics> derivatives;
        auto d = derivatives_by_symbol.find(symbol);
        if (d != derivatives_by_symbol.end()) {
            derivatives = d->second;
        }
        positioning_scores.push_back(scoring::PositioningScorer::score(
            features::PositioningFeatureExtractor::extract(derivatives)).score);
    }

    const double breadth = trend_valid > 0
        ? static_cast<double>(uptrend_count) / trend_valid * 100.0
        : scoring::kNeutralScore;
    const double avg_positioning = positioning_scores.empty()
        ? scoring::kNeutralScore
        : TechnicalIndicators::calculateMean(positioning_scores);

    health.benchmark_trend = bench_trend;
    health.breadth_pct = breadth;
    health.benchmark_volatility = bench_vol;
    health.avg_positioning = avg_positioning;
    health.risk_on = riskOnIndex(bench_trend, breadth, bench_vol, avg_positioning);

    scoring::RegimeClassifier classifier(thresholds_);
    health.regime = classifier.classify(health);

    LOG_INFO("Market health: benchmark={} trend={:.1f} breadth={:.1f}% risk_on={:.1f} regime={}",
             benchmark, bench_trend, breadth, *health.risk_on, regimeToString(health.regime));
    return health;
}

double MarketHealthAnalyzer::riskOnIndex(double benchmark_trend, double breadth_pct,
                                         double benchmark_volatility, double avg_positioning) {
    const double risk_on = 0.40 * benchmark_trend +
                           0.30 * breadth_pct +
                           0.15 * volatilityComfort(benchmark_volatility) +
                           0.15 * avg_positioning;
    return TechnicalIndicators::clamp(risk_on);
}

double MarketHealthAnalyzer::volatilityComfort(double volatility_score) {
    const double offset = std::abs(volatility_score - 50.0);
    return TechnicalIndicators::clamp(100.0 - std::min(100.0, offset * 2.0));
}

} // namespace analytics
} // namespace confluence
