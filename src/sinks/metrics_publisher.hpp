#pragma once
#include "../core/event_bus.hpp"
#include "sinks.hpp"

namespace pw {
// Turns response times into MetricEvents on the bus (and from there into
// whatever stores are attached, a JSON-lines file in practice).
class BusMetricsPublisher : public MetricsPublisher {
   public:
    explicit BusMetricsPublisher(EventBus& bus) : bus_(bus) {}
    void publish(const std::string& location, const std::string& url, int resp_code,
                 double resp_ms) override;

   private:
    EventBus& bus_;
};
}  // namespace pw
