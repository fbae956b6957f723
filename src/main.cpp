#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config/config.hpp"
#include "core/event_bus.hpp"
#include "core/logger.hpp"
#include "core/stop_signal.hpp"
#include "core/store_jsonl.hpp"
#include "monitor/alert_manager.hpp"
#include "monitor/orchestrator.hpp"
#include "monitor/shutdown.hpp"
#include "probes/http_probe.hpp"
#include "report/console.hpp"
#include "report/sample_format.hpp"
#include "sinks/metrics_publisher.hpp"
#include "sinks/twilio_notifier.hpp"
#include "sinks/webhook.hpp"

using namespace pw;

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) {
        if (!out.empty()) out += ' ';
        out += s;
    }
    return out;
}

static int cmd_monitor(const Config& cfg) {
    Console console(std::cout);
    StopSignal stop;
    // Must exist before any probe thread so every thread inherits the blocked mask.
    ShutdownCoordinator shutdown(stop, console);
    if (!shutdown.start()) log(LogLevel::WARN, "signal listener unavailable, SIGINT/SIGTERM keep their default action");

    EventBus bus;
    std::unique_ptr<JsonlStore> store;
    std::unique_ptr<BusMetricsPublisher> metrics;
    if (!cfg.metrics_path.empty()) {
        store = std::make_unique<JsonlStore>(cfg.metrics_path);
        if (store->is_open()) {
            bus.add_sink(store.get());
            metrics = std::make_unique<BusMetricsPublisher>(bus);
            log(LogLevel::INFO, "publishing metrics to " + cfg.metrics_path);
        }
    }

    std::unique_ptr<WebhookPublisher> webhook;
    if (!cfg.webhook_url.empty()) {
        webhook = std::make_unique<WebhookPublisher>(cfg.webhook_url);
        log(LogLevel::INFO, "publishing to webhook " + cfg.webhook_url);
    }

    std::unique_ptr<TwilioNotifier> notifier;
    if (cfg.twilio.complete()) notifier = std::make_unique<TwilioNotifier>(cfg.twilio);
    AlertManager alerts(cfg.alert_threshold(), std::chrono::seconds(cfg.alert_interval_s),
                        notifier.get(), cfg.sms_receivers);

    HttpProbeOptions popts;
    popts.total_timeout_s = static_cast<long>(cfg.timeout_s);
    popts.connect_timeout_s = std::min(popts.connect_timeout_s, popts.total_timeout_s);
    HttpProbe probe(cfg.location, popts);

    LoopOptions lopts;
    lopts.max_attempts = cfg.num_tests;
    lopts.max_failures = cfg.max_failures;
    lopts.delay = std::chrono::seconds(cfg.delay_s);
    lopts.json = cfg.json;
    LoopSinks sinks{metrics.get(), webhook.get(), &alerts};

    log(LogLevel::INFO, "testing " + join(cfg.targets) + " from " + cfg.location);
    if (!cfg.json) console.write_line(text_header());

    Orchestrator orchestrator(probe, console, stop, lopts, sinks);
    std::vector<LoopResult> results;
    bool ok = orchestrator.run(cfg.targets, results);
    shutdown.finish();
    return ok ? 0 : 1;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Config cfg;
    std::string err;
    if (!parse_config(args, process_env(), cfg, err)) {
        std::cerr << "error: " << err << "\n" << usage(argv[0]);
        return 1;
    }
    if (cfg.help) {
        std::cerr << usage(argv[0]);
        return 0;
    }
    set_log_level(level_for_verbosity(cfg.verbose, cfg.quiet));
    if (cfg.targets.empty()) {
        log(LogLevel::ERROR, "no destinations to test");
        std::cerr << usage(argv[0]);
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        log(LogLevel::ERROR, "curl_global_init failed");
        return 1;
    }
    int rc = cmd_monitor(cfg);
    curl_global_cleanup();
    return rc;
}
