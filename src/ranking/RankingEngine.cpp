#include "ranking/RankingEngine.h"
#include "ranking/RankingFilters.h"
#include "common/Logger.h"
#include <algorithm>
#include <functional>

namespace confluence {
namespace ranking {

using pipeline::ScoreBundle;

namespace {
using Bundles = std::vector<ScoreBundle>;

Bundles sortedBy(Bundles bundles, const std::function<double(const ScoreBundle&)>& key) {
    std::stable_sort(bundles.begin(), bundles.end(),
                     [&key](const ScoreBundle& a, const ScoreBundle& b) {
                         return key(a) > key(b);
                     });
    return bundles;
}

Bundles truncated(Bundles bundles, size_t n) {
    if (bundles.size() > n) {
        bundles.resize(n);
    }
    return bundles;
}

Bundles atLeast(const Bundles& bundles, double floor,
                const std::function<double(const ScoreBundle&)>& key) {
    Bundles out;
    for (const auto& bundle : bundles) {
        if (key(bundle) >= floor) {
            out.push_back(bundle);
        }
    }
    return out;
}

double byConfluence(const ScoreBundle& b) { return b.confluence_score; }
double byRs(const ScoreBundle& b) { return b.scores.rs.score; }
double byVolume(const ScoreBundle& b) { return b.scores.volume.score; }
double byVolatility(const ScoreBundle& b) { return b.scores.volatility.score; }
}

std::string patternBoardName(const std::string& pattern_name) {
    return "pattern_" + pattern_name;
}

const std::vector<ScoreBundle>& RankingOutput::board(const std::string& name) const {
    static const std::vector<ScoreBundle> empty;
    auto it = leaderboards.find(name);
    return it != leaderboards.end() ? it->second : empty;
}

RankingEngine::RankingEngine(const RankingConfig& config,
                             const std::vector<std::string>& pattern_names)
    : config_(config)
    , pattern_names_(pattern_names)
{
}

size_t RankingEngine::resolveTopN(std::optional<int> top_n, size_t available) const {
    for (const auto& candidate : {top_n, config_.top_n, config_.reports_top_n}) {
        if (candidate && *candidate > 0) {
            return static_cast<size_t>(*candidate);
        }
    }
    return available;
}

RankingOutput RankingEngine::rank(const std::vector<ScoreBundle>& bundles,
                                  std::optional<int> top_n) const {
    RankingOutput output;
    output.filtered = RankingFilters(config_.filters).apply(bundles);

    const size_t n = resolveTopN(top_n, output.filtered.size());
    const Bundles by_confluence = sortedBy(output.filtered, byConfluence);

    auto& boards = output.leaderboards;
    boards["all_by_confluence"] = by_confluence;
    boards["top_confluence"] = truncated(by_confluence, n);
    boards["top_relative_strength"] = truncated(sortedBy(output.filtered, byRs), n);
    boards["volume_surge"] = truncated(
        sortedBy(atLeast(output.filtered, config_.volume_surge_min_score, byVolume), byVolume), n);
    boards["volatility_squeeze"] = truncated(
        sortedBy(atLeast(output.filtered, config_.volatility_squeeze_min_score, byVolatility),
                 byVolatility), n);
    boards["watchlist"] = atLeast(by_confluence, config_.watchlist_min_confluence, byConfluence);

    for (const auto& name : pattern_names_) {
        Bundles matches;
        for (const auto& bundle : by_confluence) {
            if (bundle.hasPattern(name)) {
                matches.push_back(bundle);
            }
        }
        boards[patternBoardName(name)] = truncated(matches, n);
    }

    LOG_INFO("[Ranking] {} of {} symbols ranked, top_n {}, watchlist {}",
             output.filtered.size(), bundles.size(), n, boards["watchlist"].size());
    return output;
}

} // namespace ranking
} // namespace confluence
