#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

#include "../src/monitor/alert_manager.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

int main() {
    using pw_test::make_sample;
    auto t0 = pw::WallClock::now();

    // 150ms breaches at t=0 (alert), t=100s on another target (suppressed), t=400s (alert).
    {
        pw_test::RecordingNotifier notifier;
        pw::AlertManager am(100ms, 300s, &notifier, {"+15550100"});
        auto s1 = make_sample("https://a.example/", 150, t0);
        auto s2 = make_sample("https://b.example/", 150, t0 + 100s);
        auto s3 = make_sample("https://a.example/", 150, t0 + 400s);
        if (!am.exceeds(s1)) return 1;
        if (am.consider(s1, s1.url) != pw::AlertDecision::Dispatched) return 2;
        if (am.consider(s2, s2.url) != pw::AlertDecision::Suppressed) return 3;
        if (am.consider(s3, s3.url) != pw::AlertDecision::Dispatched) return 4;
        if (notifier.count() != 2) return 5;
        if (notifier.sent[0].find("on https://a.example/ exceeds 100.000ms") == std::string::npos)
            return 6;
    }

    // The threshold is exclusive.
    {
        pw::AlertManager am(100ms, 300s, nullptr, {});
        assert(!am.exceeds(make_sample("u", 100, t0)));
        assert(am.exceeds(make_sample("u", 100.001, t0)));
    }

    // Every recipient gets the message; a failing sink does not change the decision.
    {
        pw_test::RecordingNotifier notifier;
        notifier.fail = true;
        pw::AlertManager am(100ms, 300s, &notifier, {"+15550100", "+15550101"});
        if (am.consider(make_sample("u", 500, t0), "u") != pw::AlertDecision::Dispatched) return 10;
        if (notifier.count() != 2) return 11;
    }

    // No credentials or no recipients: reported, still debounced.
    {
        pw_test::RecordingNotifier notifier;
        pw::AlertManager no_sink(100ms, 300s, nullptr, {"+15550100"});
        if (no_sink.consider(make_sample("u", 500, t0), "u") != pw::AlertDecision::Unconfigured)
            return 20;
        if (no_sink.consider(make_sample("u", 500, t0 + 1s), "u") != pw::AlertDecision::Suppressed)
            return 21;
        pw::AlertManager no_recipients(100ms, 300s, &notifier, {});
        if (no_recipients.consider(make_sample("u", 500, t0), "u") != pw::AlertDecision::Unconfigured)
            return 22;
        if (notifier.count() != 0) return 23;
    }

    // Many loops breaching at once: exactly one dispatch.
    {
        pw_test::RecordingNotifier notifier;
        pw::AlertManager am(100ms, 300s, &notifier, {"+15550100"});
        std::atomic<bool> go{false};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i]() {
                while (!go.load()) std::this_thread::yield();
                auto s = make_sample("https://t" + std::to_string(i) + ".example/", 200, t0 + 1s * i);
                am.consider(s, s.url);
            });
        }
        go = true;
        for (auto& t : threads) t.join();
        if (notifier.count() != 1) return 30;
    }

    assert(pw::format_duration(std::chrono::milliseconds(1500)) == "1.500s");
    assert(pw::format_duration(std::chrono::microseconds(150500)) == "150.500ms");
    return 0;
}
