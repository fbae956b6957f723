#include "target_url.hpp"
#include <curl/curl.h>
#include <memory>

namespace pw {
namespace {
struct UrlPartDeleter {
    void operator()(char* p) const { curl_free(p); }
};
using UrlPart = std::unique_ptr<char, UrlPartDeleter>;

bool get_part(CURLU* u, CURLUPart what, std::string& out) {
    char* raw = nullptr;
    CURLUcode rc = curl_url_get(u, what, &raw, 0);
    UrlPart part(raw);
    if (rc != CURLUE_OK || !part) return false;
    out = part.get();
    return true;
}
}  // namespace

bool normalize_target(const std::string& raw, std::string& out, std::string& err) {
    if (raw.empty()) {
        err = "empty target";
        return false;
    }
    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> u(curl_url(), &curl_url_cleanup);
    if (!u) {
        err = "out of memory";
        return false;
    }
    // "host:port/path" would otherwise read as scheme "host".
    std::string full = raw.find("://") == std::string::npos ? "https://" + raw : raw;
    CURLUcode rc = curl_url_set(u.get(), CURLUPART_URL, full.c_str(), 0);
    if (rc != CURLUE_OK) {
        err = std::string("invalid URL: ") + curl_url_strerror(rc);
        return false;
    }
    std::string scheme, host, port, path;
    if (!get_part(u.get(), CURLUPART_SCHEME, scheme) || !get_part(u.get(), CURLUPART_HOST, host)) {
        err = "URL has no host";
        return false;
    }
    if (scheme != "http" && scheme != "https") {
        err = "unsupported scheme " + scheme;
        return false;
    }
    // CURLUPART_PORT is only set when the URL names one explicitly.
    if (!get_part(u.get(), CURLUPART_PORT, port)) port.clear();
    if (!get_part(u.get(), CURLUPART_PATH, path) || path.empty()) path = "/";
    out = scheme + "://" + host + (port.empty() ? "" : ":" + port) + path;
    return true;
}
}  // namespace pw
