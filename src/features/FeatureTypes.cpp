#include "features/FeatureTypes.h"

namespace confluence {
namespace features {

namespace {
double flag(bool value) {
    return value ? 1.0 : 0.0;
}
}

const RsHorizon* RsFeatures::find(int bars) const {
    for (const auto& horizon : horizons) {
        if (horizon.bars == bars) return &horizon;
    }
    return nullptr;
}

const std::vector<int>& defaultRsHorizons() {
    static const std::vector<int> horizons = {20, 60, 120};
    return horizons;
}

std::map<std::string, double> FeatureBundle::toMap() const {
    std::map<std::string, double> out;

    out["trend_ma_alignment"] = trend.ma_alignment;
    out["trend_persistence"] = trend.persistence;
    out["trend_distance_from_ma_pct"] = trend.distance_from_ma_pct;
    out["trend_ma_slope_pct"] = trend.ma_slope_pct;
    out["has_trend_data"] = flag(trend.has_data);

    out["volatility_atr_pct_14"] = volatility.atr_pct_14;
    out["volatility_bb_width_pct_20"] = volatility.bb_width_pct_20;
    out["volatility_contraction_ratio_60_20"] = volatility.contraction_ratio_60_20;
    out["has_volatility_data"] = flag(volatility.has_data);

    out["volume_rvol_20_1"] = volume.rvol_20_1;
    out["volume_trend_slope_pct_20_10"] = volume.trend_slope_pct_20_10;
    out["volume_percentile_60"] = volume.percentile_60;
    out["has_volume_data"] = flag(volume.has_data);

    for (const auto& horizon : rs.horizons) {
        const std::string h = std::to_string(horizon.bars);
        out["rs_ret_" + h + "_pct"] = horizon.return_pct;
        if (horizon.rank_pct) {
            out["rs_" + h + "_rank_pct"] = *horizon.rank_pct;
        }
    }
    out["has_rs_data"] = flag(rs.has_data);

    out["positioning_funding_rate"] = positioning.funding_rate;
    out["positioning_oi_change_pct"] = positioning.oi_change_pct;
    out["has_positioning_data"] = flag(positioning.has_data);

    return out;
}

} // namespace features
} // namespace confluence
