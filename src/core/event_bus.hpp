#pragma once
#include <mutex>
#include <string>
#include <vector>

namespace pw {
// A response-time measurement as published to metrics sinks.
struct MetricEvent {
    std::string ts_wall;
    std::string location;
    std::string url;
    std::string resp_code;  // "%03d" for a real response, "0" for a transport error
    double resp_ms{};
};

class MetricSink {
   public:
    virtual ~MetricSink() = default;
    virtual void on_metric(const MetricEvent& ev) = 0;
};

// Fans events out to every registered sink. emit() is called from all probe
// threads at once, so delivery is serialized here and sinks need no locking.
class EventBus {
   public:
    void add_sink(MetricSink* sink) {
        std::lock_guard<std::mutex> lk(mu_);
        sinks_.push_back(sink);
    }
    void emit(const MetricEvent& ev) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto* s : sinks_) s->on_metric(ev);
    }
    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sinks_.empty();
    }

   private:
    mutable std::mutex mu_;
    std::vector<MetricSink*> sinks_;
};
}  // namespace pw
