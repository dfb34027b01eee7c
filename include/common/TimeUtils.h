#pragma once

#include <optional>
#include <string>
#include "common/Types.h"

namespace confluence {
namespace utils {

// UTC ISO-8601 in the 'YYYY-MM-DDTHH:MM:SSZ' form used by the alert state file
class TimeUtils {
public:
    static std::string toIso8601(Timestamp tp);
    static std::optional<Timestamp> fromIso8601(const std::string& text);

    static Timestamp fromEpochMs(long long epoch_ms);
    static std::string formatEpochMs(long long epoch_ms);
};

} // namespace utils
} // namespace confluence
