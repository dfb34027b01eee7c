#pragma once

#include <memory>
#include <string>
#include <vector>
#include "alerts/AlertTypes.h"

namespace confluence {
namespace alerts {

// Outbound transport for alert events
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual std::string name() const = 0;
    virtual void send(const std::vector<AlertEvent>& events) = 0;
};

// [ALERT] symbol | reason | CS: x | message
class ConsoleNotifier : public INotifier {
public:
    std::string name() const override { return "console"; }
    void send(const std::vector<AlertEvent>& events) override;

    static std::string formatLine(const AlertEvent& event);
};

// Fans events out to every notifier and records them in the alert log.
// A failing notifier does not stop the others.
class AlertDispatcher {
public:
    void addNotifier(std::shared_ptr<INotifier> notifier);
    size_t notifierCount() const { return notifiers_.size(); }

    void dispatch(const std::vector<AlertEvent>& events);

private:
    std::vector<std::shared_ptr<INotifier>> notifiers_;
};

} // namespace alerts
} // namespace confluence
