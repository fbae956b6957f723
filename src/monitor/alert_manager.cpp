#include "alert_manager.hpp"
#include <cstdio>
#include <utility>
#include "../core/logger.hpp"

namespace pw {
std::string format_duration(std::chrono::nanoseconds d) {
    char buf[48];
    double ms = to_msec(d);
    if (ms >= 1000.0)
        std::snprintf(buf, sizeof(buf), "%.3fs", ms / 1000.0);
    else
        std::snprintf(buf, sizeof(buf), "%.3fms", ms);
    return std::string(buf);
}

AlertManager::AlertManager(std::chrono::milliseconds threshold, std::chrono::seconds debounce,
                           Notifier* notifier, std::vector<std::string> recipients)
    : threshold_(threshold),
      debounce_(debounce),
      notifier_(notifier),
      recipients_(std::move(recipients)) {}

std::string AlertManager::format_message(const Sample& s, const std::string& url) const {
    return "RespTime " + format_duration(s.resp_time()) + " on " + url + " exceeds " +
           format_duration(threshold_);
}

AlertDecision AlertManager::consider(const Sample& s, const std::string& url) {
    std::string msg = format_message(s, url);
    log(LogLevel::INFO, msg);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (has_last_ && s.start - last_alert_ < debounce_) {
            log(LogLevel::DEBUG, "too soon to send another alert");
            return AlertDecision::Suppressed;
        }
        has_last_ = true;
        last_alert_ = s.start;
    }

    if (!notifier_ || recipients_.empty()) {
        log(LogLevel::WARN, "nowhere to send notification for " + url);
        return AlertDecision::Unconfigured;
    }
    for (const auto& r : recipients_) {
        if (!notifier_->send(msg, r)) log(LogLevel::WARN, "alert to " + r + " was not delivered");
    }
    return AlertDecision::Dispatched;
}
}  // namespace pw
