#include "common/TimeUtils.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace confluence {
namespace utils {

namespace {
constexpr const char* kIsoFormat = "%Y-%m-%dT%H:%M:%SZ";

bool toUtc(std::time_t t, std::tm& out) {
#ifdef _WIN32
    return gmtime_s(&out, &t) == 0;
#else
    return gmtime_r(&t, &out) != nullptr;
#endif
}

std::time_t fromUtc(std::tm& tm_utc) {
#ifdef _WIN32
    return _mkgmtime(&tm_utc);
#else
    return timegm(&tm_utc);
#endif
}
} // namespace

std::string TimeUtils::toIso8601(Timestamp tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    if (!toUtc(t, tm_utc)) {
        return {};
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, kIsoFormat);
    return oss.str();
}

std::optional<Timestamp> TimeUtils::fromIso8601(const std::string& text) {
    std::tm tm_utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm_utc, kIsoFormat);
    if (iss.fail()) {
        return std::nullopt;
    }
    iss >> std::ws;
    if (!iss.eof()) {
        return std::nullopt;
    }

    const std::time_t t = fromUtc(tm_utc);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

Timestamp TimeUtils::fromEpochMs(long long epoch_ms) {
    return Timestamp(std::chrono::milliseconds(epoch_ms));
}

std::string TimeUtils::formatEpochMs(long long epoch_ms) {
    return toIso8601(fromEpochMs(epoch_ms));
}

} // namespace utils
} // namespace confluence
