#pragma once
#include <string>

#include "../probes/probe.hpp"

namespace pw {
// Receives the response time of every successful sample.
class MetricsPublisher {
   public:
    virtual ~MetricsPublisher() = default;
    virtual void publish(const std::string& location, const std::string& url, int resp_code,
                         double resp_ms) = 0;
};

// Receives every successful sample in full.
class SamplePublisher {
   public:
    virtual ~SamplePublisher() = default;
    virtual void publish(const Sample& s) = 0;
};

// Delivers an alert text to one recipient. Returns false when delivery failed;
// the caller only logs that.
class Notifier {
   public:
    virtual ~Notifier() = default;
    virtual bool send(const std::string& message, const std::string& recipient) = 0;
};
}  // namespace pw
