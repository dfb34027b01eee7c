#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "pipeline/ScoreBundle.h"
#include "ranking/RankingConfig.h"

namespace confluence {
namespace ranking {

struct RankingOutput {
    std::vector<pipeline::ScoreBundle> filtered;
    // all_by_confluence, top_confluence, top_relative_strength, volume_surge,
    // volatility_squeeze, watchlist, plus pattern_<name> per pattern
    std::map<std::string, std::vector<pipeline::ScoreBundle>> leaderboards;

    const std::vector<pipeline::ScoreBundle>& board(const std::string& name) const;
};

// Board key for a pattern name, e.g. "pattern_breakout"
std::string patternBoardName(const std::string& pattern_name);

class RankingEngine {
public:
    RankingEngine(const RankingConfig& config = RankingConfig(),
                  const std::vector<std::string>& pattern_names = {});

    RankingOutput rank(const std::vector<pipeline::ScoreBundle>& bundles,
                       std::optional<int> top_n = std::nullopt) const;

    // explicit > ranking.top_n > reports.top_n > available
    size_t resolveTopN(std::optional<int> top_n, size_t available) const;

private:
    RankingConfig config_;
    std::vector<std::string> pattern_names_;
};

} // namespace ranking
} // namespace confluence
