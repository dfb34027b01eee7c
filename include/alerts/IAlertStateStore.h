#pragma once

#include "alerts/AlertTypes.h"

namespace confluence {
namespace alerts {

class IAlertStateStore {
public:
    virtual ~IAlertStateStore() = default;

    // Missing or unreadable state yields an empty AlertState
    virtual AlertState load() = 0;
    virtual bool save(const AlertState& state) = 0;
};

} // namespace alerts
} // namespace confluence
