#pragma once

#include <optional>
#include <string>
#include "pattern/PatternTypes.h"

namespace confluence {
namespace pattern {

// Stateless detector. Returns a signal only when the pattern triggers.
class IPatternDetector {
public:
    virtual ~IPatternDetector() = default;

    virtual std::string name() const = 0;
    virtual std::optional<PatternSignal> detect(const PatternContext& ctx) const = 0;
};

} // namespace pattern
} // namespace confluence
