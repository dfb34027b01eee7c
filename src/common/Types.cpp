#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace confluence {

std::string regimeToString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULL: return "bull";
        case MarketRegime::BEAR: return "bear";
        case MarketRegime::SIDEWAYS: return "sideways";
        case MarketRegime::UNKNOWN: return "unknown";
    }
    return "unknown";
}

MarketRegime regimeFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "bull") return MarketRegime::BULL;
    if (lower == "bear") return MarketRegime::BEAR;
    if (lower == "sideways") return MarketRegime::SIDEWAYS;
    return MarketRegime::UNKNOWN;
}

} // namespace confluence
