#include "webhook.hpp"
#include "../core/logger.hpp"
#include "../report/sample_format.hpp"
#include "http_post.hpp"

namespace pw {
WebhookPublisher::WebhookPublisher(const std::string& url) : url_(url) {}

void WebhookPublisher::publish(const Sample& s) {
    log(LogLevel::DEBUG, "publishing " + s.remote + " to webhook");
    HttpPostRequest req;
    req.url = url_;
    req.body = sample_json(s);
    req.content_type = "application/json";
    HttpPostResponse resp;
    if (!http_post(req, resp)) {
        log(LogLevel::WARN, "webhook POST to " + url_ + " failed: " + resp.error);
        return;
    }
    if (resp.status < 200 || resp.status >= 300)
        log(LogLevel::WARN, "webhook " + url_ + " answered HTTP " + std::to_string(resp.status));
}
}  // namespace pw
