#pragma once
#include <string>

#include "sinks.hpp"

namespace pw {
struct TwilioCredentials {
    std::string account_sid;
    std::string auth_token;
    std::string sender;  // registered Twilio number used as From
    std::string api_base{"https://api.twilio.com"};

    bool complete() const { return !account_sid.empty() && !auth_token.empty() && !sender.empty(); }
};

// SMS delivery through the Twilio Messages API.
class TwilioNotifier : public Notifier {
   public:
    explicit TwilioNotifier(const TwilioCredentials& creds);
    bool send(const std::string& message, const std::string& recipient) override;

    static std::string form_encode(const std::string& s);

   private:
    TwilioCredentials creds_;
};
}  // namespace pw
