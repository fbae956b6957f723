#pragma once
#include <fstream>
#include <string>
#include "event_bus.hpp"

namespace pw {
// Appends every metric event to a JSON-lines file.
class JsonlStore : public MetricSink {
   public:
    explicit JsonlStore(const std::string& path);
    ~JsonlStore();
    bool is_open() const { return is_open_; }
    void on_metric(const MetricEvent& ev) override;

   private:
    bool is_open_{false};
    std::ofstream out_;
    void write_json(const MetricEvent& ev);
};
}  // namespace pw
