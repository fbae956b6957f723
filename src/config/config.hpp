#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../sinks/twilio_notifier.hpp"

namespace pw {
struct Config {
    std::vector<std::string> targets;  // normalized scheme://host[:port]path
    int64_t delay_s{10};
    int max_failures{10};
    int64_t num_tests{0};
    bool json{false};
    int64_t alert_ms{0};  // 0 disables alerting
    int64_t alert_interval_s{300};
    std::string metrics_path;
    std::string webhook_url;
    int64_t timeout_s{10};
    int verbose{0};
    bool quiet{false};
    bool help{false};
    std::string location;
    TwilioCredentials twilio;
    std::vector<std::string> sms_receivers;

    // A zero threshold means "never": a day is beyond any request timeout.
    std::chrono::milliseconds alert_threshold() const {
        return alert_ms > 0 ? std::chrono::milliseconds(alert_ms) : std::chrono::hours(24);
    }
};

// Reads one environment variable; returns false when it is not set.
using EnvLookup = std::function<bool(const std::string& name, std::string& value)>;

EnvLookup process_env();

// Fills cfg from command line arguments (without argv[0]) and the environment.
// Returns false with err set on a malformed flag or value, or an unusable target.
bool parse_config(const std::vector<std::string>& args, const EnvLookup& env, Config& cfg,
                  std::string& err);

std::string usage(const std::string& prog);

// Splits on runs of spaces, dropping empty fields.
std::vector<std::string> split_fields(const std::string& s);
}  // namespace pw
