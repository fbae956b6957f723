#pragma once
#include <string>

#include "sinks.hpp"

namespace pw {
// POSTs each sample as JSON to an https endpoint. Delivery errors are logged
// and dropped; the next sample simply tries again.
class WebhookPublisher : public SamplePublisher {
   public:
    explicit WebhookPublisher(const std::string& url);
    void publish(const Sample& s) override;
    const std::string& url() const { return url_; }

   private:
    std::string url_;
};
}  // namespace pw
