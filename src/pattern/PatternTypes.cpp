#include "pattern/PatternTypes.h"

namespace confluence {
namespace pattern {

std::string directionToString(SignalDirection direction) {
    switch (direction) {
        case SignalDirection::BULLISH: return "bullish";
        case SignalDirection::BEARISH: return "bearish";
        case SignalDirection::NONE: return "";
    }
    return "";
}

nlohmann::json PatternSignal::toJson() const {
    nlohmann::json j;
    j["pattern_name"] = pattern_name;
    j["symbol"] = symbol;
    j["timeframe"] = timeframe;
    j["triggered"] = triggered;
    if (direction == SignalDirection::NONE) {
        j["direction"] = nullptr;
    } else {
        j["direction"] = directionToString(direction);
    }
    j["strength"] = strength;
    j["confidence"] = confidence;
    j["notes"] = note;
    j["extras"] = extras;
    return j;
}

} // namespace pattern
} // namespace confluence
