#include "alerts/AlertDispatcher.h"
#include "common/Logger.h"

#include <exception>
#include <utility>

namespace confluence {
namespace alerts {

std::string ConsoleNotifier::formatLine(const AlertEvent& event) {
    return fmt::format("[ALERT] {} | {} | CS: {:.1f} | {}",
                       event.symbol, event.reason, event.confluence_score, event.message);
}

void ConsoleNotifier::send(const std::vector<AlertEvent>& events) {
    if (events.empty()) {
        return;
    }
    LOG_INFO("Sending {} alert(s) to console", events.size());
    for (const auto& event : events) {
        LOG_INFO("{}", formatLine(event));
    }
}

void AlertDispatcher::addNotifier(std::shared_ptr<INotifier> notifier) {
    if (notifier) {
        notifiers_.push_back(std::move(notifier));
    }
}

void AlertDispatcher::dispatch(const std::vector<AlertEvent>& events) {
    if (events.empty()) {
        return;
    }

    for (const auto& event : events) {
        Logger::getInstance().logAlert(event.symbol, event.reason,
                                       event.confluence_score, event.regime_label);
    }

    for (const auto& notifier : notifiers_) {
        try {
            notifier->send(events);
        } catch (const std::exception& e) {
            LOG_ERROR("Notifier {} failed: {}", notifier->name(), e.what());
        }
    }
}

} // namespace alerts
} // namespace confluence
