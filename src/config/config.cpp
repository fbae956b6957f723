#include "config.hpp"

#include <unistd.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "../core/logger.hpp"
#include "../probes/target_url.hpp"

namespace pw {
namespace {
// Upper bound for second-valued flags, keeps later clock arithmetic in range.
constexpr int64_t kMaxSeconds = 366LL * 24 * 3600;
constexpr int64_t kMaxMillis = kMaxSeconds * 1000;

bool parse_int(const std::string& flag, const std::string& text, int64_t min, int64_t& out,
               std::string& err) {
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::invalid_argument&) {
        used = 0;
    } catch (const std::out_of_range&) {
        err = flag + ": value out of range: " + text;
        return false;
    }
    if (used == 0 || used != text.size()) {
        err = flag + ": not a number: " + text;
        return false;
    }
    if (v < min) {
        err = flag + ": must be at least " + std::to_string(min);
        return false;
    }
    out = v;
    return true;
}

std::string local_hostname() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "unknown";
    return std::string(buf);
}
}  // namespace

EnvLookup process_env() {
    return [](const std::string& name, std::string& value) {
        const char* v = std::getenv(name.c_str());
        if (!v) return false;
        value = v;
        return true;
    };
}

std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string f;
    while (iss >> f) out.push_back(f);
    return out;
}

bool parse_config(const std::vector<std::string>& args, const EnvLookup& env, Config& cfg,
                  std::string& err) {
    std::vector<std::string> raw_targets;
    std::string webhook_flag;
    bool alert_flag = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                err = a + ": missing value";
                return false;
            }
            out = args[++i];
            return true;
        };
        std::string v;
        int64_t n = 0;
        if (a == "-h" || a == "--help") {
            cfg.help = true;
        } else if (a == "-d") {
            if (!value(v) || !parse_int(a, v, 0, cfg.delay_s, err)) return false;
            if (cfg.delay_s > kMaxSeconds) {
                err = a + ": value out of range: " + v;
                return false;
            }
        } else if (a == "-f") {
            if (!value(v) || !parse_int(a, v, 1, n, err)) return false;
            if (n > 1000000000) {
                err = a + ": value out of range: " + v;
                return false;
            }
            cfg.max_failures = static_cast<int>(n);
        } else if (a == "-n") {
            if (!value(v) || !parse_int(a, v, 0, cfg.num_tests, err)) return false;
        } else if (a == "-j") {
            cfg.json = true;
        } else if (a == "-A") {
            if (!value(v) || !parse_int(a, v, 0, cfg.alert_ms, err)) return false;
            if (cfg.alert_ms > kMaxMillis) {
                err = a + ": value out of range: " + v;
                return false;
            }
            alert_flag = cfg.alert_ms > 0;
        } else if (a == "-M") {
            if (!value(v) || !parse_int(a, v, 0, cfg.alert_interval_s, err)) return false;
            if (cfg.alert_interval_s > kMaxSeconds) {
                err = a + ": value out of range: " + v;
                return false;
            }
        } else if (a == "-m") {
            if (!value(cfg.metrics_path)) return false;
        } else if (a == "-W") {
            if (!value(webhook_flag)) return false;
        } else if (a == "-t") {
            if (!value(v) || !parse_int(a, v, 1, cfg.timeout_s, err)) return false;
        } else if (a == "-q") {
            cfg.quiet = true;
        } else if (a == "-v") {
            cfg.verbose += 1;
        } else if (a == "-V") {
            cfg.verbose += 2;
        } else if (a.size() > 1 && a[0] == '-') {
            err = "unknown flag " + a;
            return false;
        } else {
            raw_targets.push_back(a);
        }
    }

    std::string e;
    if (env("PERFTEST_URL", e)) {
        for (auto& t : split_fields(e)) raw_targets.push_back(t);
    }
    cfg.targets.clear();
    for (const auto& t : raw_targets) {
        std::string norm, why;
        if (!normalize_target(t, norm, why)) {
            err = "target " + t + ": " + why;
            return false;
        }
        cfg.targets.push_back(norm);
    }

    if (env("HTTP_JSON_WEBHOOK", e)) cfg.webhook_url = e;
    if (!webhook_flag.empty()) {
        if (!cfg.webhook_url.empty())
            log(LogLevel::WARN, "overwriting webhook from env, " + cfg.webhook_url + " via command line");
        cfg.webhook_url = webhook_flag;
    }
    if (!cfg.webhook_url.empty() && cfg.webhook_url.rfind("https://", 0) != 0) {
        log(LogLevel::ERROR, "webhook URL must start with https://, not posting to " + cfg.webhook_url);
        cfg.webhook_url.clear();
    }

    if (env("RESPONSE_THRESHOLD", e)) {
        if (alert_flag) {
            log(LogLevel::WARN, "alert threshold from command line overrides environment: " + e);
        } else {
            int64_t ms = 0;
            std::string why;
            if (parse_int("RESPONSE_THRESHOLD", e, 0, ms, why) && ms > kMaxMillis)
                log(LogLevel::WARN, "parsing environment var RESPONSE_THRESHOLD: value out of range: " + e);
            else if (why.empty())
                cfg.alert_ms = ms;
            else
                log(LogLevel::WARN, "parsing environment var " + why);
        }
    }

    if (env("TWILIO_ACCOUNT_SID", e)) cfg.twilio.account_sid = e;
    if (env("TWILIO_AUTH_TOKEN", e)) cfg.twilio.auth_token = e;
    if (env("TWILIO_SMS_SENDER", e)) cfg.twilio.sender = e;
    if (env("TWILIO_SMS_RECEIVERS", e)) cfg.sms_receivers = split_fields(e);

    if (!env("PERFTEST_LOCATION", cfg.location) || cfg.location.empty()) cfg.location = local_hostname();
    return true;
}

std::string usage(const std::string& prog) {
    std::ostringstream out;
    out << "Usage: " << prog << " [flags] URL ...\n"
        << "URLs to test -- there may be multiple of them, all will be tested in parallel.\n"
        << "Requests repeat every -d seconds until -n samples, -f failures, or a signal.\n\n"
        << "  -d <sec>   delay between test requests (default 10)\n"
        << "  -f <n>     maximum number of failures before a target is abandoned (default 10)\n"
        << "  -n <n>     number of tests to each endpoint, 0 runs until interrupted (default 0)\n"
        << "  -j         write detailed metrics as JSON records (default TSV)\n"
        << "  -A <ms>    alert threshold in milliseconds (env RESPONSE_THRESHOLD)\n"
        << "  -M <sec>   minimum interval between alerts (default 300)\n"
        << "  -m <path>  append response time metrics as JSON lines to path\n"
        << "  -W <url>   https webhook receiving each sample via POST (env HTTP_JSON_WEBHOOK)\n"
        << "  -t <sec>   per-request timeout (default 10)\n"
        << "  -q -v -V   quiet, verbose, more verbose\n\n"
        << "Environment: PERFTEST_URL, PERFTEST_LOCATION, TWILIO_ACCOUNT_SID, TWILIO_AUTH_TOKEN,\n"
        << "             TWILIO_SMS_SENDER, TWILIO_SMS_RECEIVERS\n";
    return out.str();
}
}  // namespace pw
