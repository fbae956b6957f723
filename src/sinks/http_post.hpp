#pragma once
#include <string>

namespace pw {
struct HttpPostRequest {
    std::string url;
    std::string body;
    std::string content_type;
    std::string basic_auth;  // "user:password", empty for none
    long connect_timeout_s{5};
    long total_timeout_s{10};
};

struct HttpPostResponse {
    long status{0};
    std::string body;
    std::string error;
};

// Blocking POST. Returns false on transport failure (error set); any HTTP
// status counts as delivered and is left for the caller to judge.
bool http_post(const HttpPostRequest& req, HttpPostResponse& resp);
}  // namespace pw
