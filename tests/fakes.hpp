#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../src/probes/probe.hpp"
#include "../src/sinks/sinks.hpp"

namespace pw_test {
using namespace std::chrono_literals;

// Builds a sample whose total is `ms`; phases split it 1:2:3:3:1.
inline pw::Sample make_sample(const std::string& url, double ms,
                              pw::WallClock::time_point start = pw::WallClock::now()) {
    pw::Sample s;
    s.url = url;
    s.location = "lab";
    s.remote = "192.0.2.1";
    s.start = start;
    auto total = std::chrono::nanoseconds(static_cast<int64_t>(ms * 1e6));
    s.dns = total / 10;
    s.tcp = total * 2 / 10;
    s.tls = total * 3 / 10;
    s.reply = total * 3 / 10;
    s.close = total - s.dns - s.tcp - s.tls - s.reply;
    s.total = total;
    s.resp_code = 200;
    s.size = 1000;
    return s;
}

// Per-URL script of response times; a negative entry is a failed attempt.
// Once a script runs out the last entry repeats (success at 1ms if none).
class ScriptedProbe : public pw::Probe {
   public:
    void script(const std::string& url, std::vector<double> steps) {
        std::lock_guard<std::mutex> lk(mu_);
        scripts_[url] = std::move(steps);
    }
    bool fetch(const std::string& url, pw::Sample& out, std::string& err) override {
        double ms = 1.0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            size_t n = calls_[url]++;
            auto it = scripts_.find(url);
            if (it != scripts_.end() && !it->second.empty())
                ms = n < it->second.size() ? it->second[n] : it->second.back();
        }
        if (ms < 0) {
            err = "scripted failure";
            return false;
        }
        out = make_sample(url, ms);
        return true;
    }
    size_t calls(const std::string& url) {
        std::lock_guard<std::mutex> lk(mu_);
        return calls_[url];
    }

   private:
    std::mutex mu_;
    std::map<std::string, std::vector<double>> scripts_;
    std::map<std::string, size_t> calls_;
};

class RecordingNotifier : public pw::Notifier {
   public:
    bool fail{false};
    bool send(const std::string& message, const std::string& recipient) override {
        std::lock_guard<std::mutex> lk(mu_);
        sent.push_back(recipient + ": " + message);
        return !fail;
    }
    size_t count() {
        std::lock_guard<std::mutex> lk(mu_);
        return sent.size();
    }
    std::vector<std::string> sent;

   private:
    std::mutex mu_;
};

class RecordingMetrics : public pw::MetricsPublisher {
   public:
    void publish(const std::string&, const std::string& url, int, double resp_ms) override {
        std::lock_guard<std::mutex> lk(mu_);
        values[url].push_back(resp_ms);
    }
    std::map<std::string, std::vector<double>> values;

   private:
    std::mutex mu_;
};

class RecordingWebhook : public pw::SamplePublisher {
   public:
    void publish(const pw::Sample& s) override {
        std::lock_guard<std::mutex> lk(mu_);
        urls.push_back(s.url);
    }
    std::vector<std::string> urls;

   private:
    std::mutex mu_;
};
}  // namespace pw_test
