#include "metrics_publisher.hpp"
#include "../core/logger.hpp"
#include "../core/time_utils.hpp"
#include "../report/sample_format.hpp"
#include "../util/json.hpp"

namespace pw {
void BusMetricsPublisher::publish(const std::string& location, const std::string& url,
                                  int resp_code, double resp_ms) {
    log(LogLevel::DEBUG, "publishing " + json_number(resp_ms) + " msec for " + url);
    MetricEvent ev{wall_time_iso8601(), location, url, metric_resp_code(resp_code), resp_ms};
    bus_.emit(ev);
}
}  // namespace pw
