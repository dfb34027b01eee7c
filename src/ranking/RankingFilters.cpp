#include "ranking/RankingFilters.h"
#include "common/Logger.h"
#include <cmath>

namespace confluence {
namespace ranking {

namespace {
std::string joinReasons(const std::vector<std::string>& reasons) {
    std::string out;
    for (const auto& reason : reasons) {
        if (!out.empty()) out += ", ";
        out += reason;
    }
    return out;
}
}

RankingFilters::RankingFilters(const FilterConfig& config)
    : config_(config)
{
}

FilterVerdict RankingFilters::evaluate(const pipeline::ScoreBundle& bundle) const {
    FilterVerdict verdict;
    auto& reasons = verdict.reasons;

    if (bundle.scores.trend.score < config_.min_trend_score) {
        reasons.push_back(fmt::format("trend<{:.1f}", config_.min_trend_score));
    }
    if (bundle.scores.rs.score < config_.min_rs_score) {
        reasons.push_back(fmt::format("rs<{:.1f}", config_.min_rs_score));
    }
    if (bundle.scores.volume.score < config_.min_volume_score) {
        reasons.push_back(fmt::format("volume<{:.1f}", config_.min_volume_score));
    }
    if (bundle.scores.volatility.score < config_.min_volatility_score) {
        reasons.push_back(fmt::format("volatility<{:.1f}", config_.min_volatility_score));
    }

    const double atr_pct = bundle.features.volatility.atr_pct_14;
    if (config_.max_atr_pct) {
        if (!std::isfinite(atr_pct)) {
            reasons.push_back("atr_pct_unusable");
        } else if (atr_pct > *config_.max_atr_pct) {
            reasons.push_back(fmt::format("atr_pct>{:.1f}", *config_.max_atr_pct));
        }
    }

    const double bb_width_pct = bundle.features.volatility.bb_width_pct_20;
    if (config_.max_bb_width_pct) {
        if (!std::isfinite(bb_width_pct)) {
            reasons.push_back("bb_width_pct_unusable");
        } else if (bb_width_pct > *config_.max_bb_width_pct) {
            reasons.push_back(fmt::format("bb_width_pct>{:.1f}", *config_.max_bb_width_pct));
        }
    }

    verdict.passed = reasons.empty();
    return verdict;
}

std::vector<pipeline::ScoreBundle> RankingFilters::apply(
    const std::vector<pipeline::ScoreBundle>& bundles
) const {
    LOG_INFO("[Filters] received {} symbols", bundles.size());

    std::vector<pipeline::ScoreBundle> kept;
    for (const auto& bundle : bundles) {
        const auto verdict = evaluate(bundle);
        if (verdict.passed) {
            kept.push_back(bundle);
        } else {
            LOG_DEBUG("[Filters] dropping {}: {}", bundle.symbol, joinReasons(verdict.reasons));
        }
    }

    LOG_INFO("[Filters] {} symbols passed, {} dropped", kept.size(), bundles.size() - kept.size());
    return kept;
}

} // namespace ranking
} // namespace confluence
