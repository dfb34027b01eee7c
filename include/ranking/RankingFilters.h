#pragma once

#include <string>
#include <vector>
#include "pipeline/ScoreBundle.h"
#include "ranking/RankingConfig.h"

namespace confluence {
namespace ranking {

struct FilterVerdict {
    bool passed = true;
    std::vector<std::string> reasons;   // e.g. "trend<55.0", "atr_pct>8.0"
};

class RankingFilters {
public:
    explicit RankingFilters(const FilterConfig& config = FilterConfig());

    FilterVerdict evaluate(const pipeline::ScoreBundle& bundle) const;

    // Keeps input order; rejections are logged with their reasons
    std::vector<pipeline::ScoreBundle> apply(const std::vector<pipeline::ScoreBundle>& bundles) const;

private:
    FilterConfig config_;
};

} // namespace ranking
} // namespace confluence
