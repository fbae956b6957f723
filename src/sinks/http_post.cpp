#include "http_post.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>

namespace pw {
namespace {
constexpr size_t kMaxReplyBytes = 64 * 1024;

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t n = size * nmemb;
    // Keep reading past the cap so the connection drains; just stop storing.
    if (out->size() < kMaxReplyBytes) out->append(ptr, std::min(n, kMaxReplyBytes - out->size()));
    return n;
}

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
}  // namespace

bool http_post(const HttpPostRequest& req, HttpPostResponse& resp) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> h(curl_easy_init(), &curl_easy_cleanup);
    if (!h) {
        resp.error = "curl_easy_init failed";
        return false;
    }
    CURL* c = h.get();
    std::unique_ptr<curl_slist, SlistDeleter> headers;
    auto add_header = [&headers](const std::string& line) {
        curl_slist* l = curl_slist_append(headers.get(), line.c_str());
        if (l) {
            headers.release();
            headers.reset(l);
        }
    };
    add_header("Content-Type: " + req.content_type);
    add_header("Accept: application/json");

    char errbuf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(c, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c, CURLOPT_POST, 1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, req.connect_timeout_s);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, req.total_timeout_s);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);
    if (!req.basic_auth.empty()) {
        curl_easy_setopt(c, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(c, CURLOPT_USERPWD, req.basic_auth.c_str());
    }

    CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return false;
    }
    if (curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status) != CURLE_OK) resp.status = 0;
    return true;
}
}  // namespace pw
