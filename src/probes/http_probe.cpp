#include "http_probe.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <utility>
#include "../core/logger.hpp"

namespace pw {
namespace {
size_t discard_body(char*, size_t size, size_t nmemb, void*) { return size * nmemb; }

curl_off_t info_usec(CURL* c, CURLINFO what) {
    curl_off_t v = 0;
    if (curl_easy_getinfo(c, what, &v) != CURLE_OK) return 0;
    return v;
}

std::chrono::nanoseconds usec(curl_off_t v) {
    return std::chrono::microseconds(v < 0 ? 0 : v);
}
}  // namespace

HttpProbe::HttpProbe(const std::string& location, const HttpProbeOptions& opts)
    : location_(location), opts_(opts) {}

bool HttpProbe::fetch(const std::string& url, Sample& out, std::string& err) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> h(curl_easy_init(), &curl_easy_cleanup);
    if (!h) {
        err = "curl_easy_init failed";
        return false;
    }
    CURL* c = h.get();
    char errbuf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_s);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, opts_.total_timeout_s);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(c, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(c, CURLOPT_USERAGENT, "perfwatch/1.0");

    Sample s;
    s.url = url;
    s.location = location_;
    s.start = WallClock::now();
    CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        err = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return false;
    }

    curl_off_t dns = info_usec(c, CURLINFO_NAMELOOKUP_TIME_T);
    curl_off_t connect = std::max(info_usec(c, CURLINFO_CONNECT_TIME_T), dns);
    curl_off_t app = info_usec(c, CURLINFO_APPCONNECT_TIME_T);
    curl_off_t ready = std::max(connect, app);
    curl_off_t first = std::max(info_usec(c, CURLINFO_STARTTRANSFER_TIME_T), ready);
    curl_off_t total = std::max(info_usec(c, CURLINFO_TOTAL_TIME_T), first);

    s.dns = usec(dns);
    s.tcp = usec(connect - dns);
    s.tls = app > 0 ? usec(app - connect) : std::chrono::nanoseconds(0);
    s.reply = usec(first - ready);
    s.close = usec(total - first);
    s.total = usec(total);

    long code = 0;
    if (curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK) s.resp_code = static_cast<int>(code);
    curl_off_t size = 0;
    if (curl_easy_getinfo(c, CURLINFO_SIZE_DOWNLOAD_T, &size) == CURLE_OK) s.size = size;
    char* ip = nullptr;
    if (curl_easy_getinfo(c, CURLINFO_PRIMARY_IP, &ip) == CURLE_OK && ip) s.remote = ip;

    log(LogLevel::TRACE, "fetched " + url + " code " + std::to_string(s.resp_code) + " from " + s.remote);
    out = std::move(s);
    return true;
}
}  // namespace pw
