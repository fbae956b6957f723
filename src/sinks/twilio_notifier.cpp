#include "twilio_notifier.hpp"
#include <cctype>
#include <cstdio>
#include "../core/logger.hpp"
#include "../util/json.hpp"
#include "http_post.hpp"

namespace pw {
TwilioNotifier::TwilioNotifier(const TwilioCredentials& creds) : creds_(creds) {}

std::string TwilioNotifier::form_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

bool TwilioNotifier::send(const std::string& message, const std::string& recipient) {
    log(LogLevel::DEBUG, "sending Twilio msg to SMS " + recipient);
    HttpPostRequest req;
    req.url = creds_.api_base + "/2010-04-01/Accounts/" + creds_.account_sid + "/Messages.json";
    req.body = "To=" + form_encode(recipient) + "&From=" + form_encode(creds_.sender) +
               "&Body=" + form_encode(message);
    req.content_type = "application/x-www-form-urlencoded";
    req.basic_auth = creds_.account_sid + ":" + creds_.auth_token;
    HttpPostResponse resp;
    if (!http_post(req, resp)) {
        log(LogLevel::WARN, "Twilio request failed: " + resp.error);
        return false;
    }
    if (resp.status < 200 || resp.status >= 300) {
        log(LogLevel::WARN, "Twilio HTTP error " + std::to_string(resp.status));
        return false;
    }
    std::string sid;
    if (extract_string(resp.body, "sid", sid))
        log(LogLevel::INFO, "Twilio message " + sid + " queued for " + recipient);
    return true;
}
}  // namespace pw
