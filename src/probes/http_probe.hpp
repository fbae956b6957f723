#pragma once
#include <string>

#include "probe.hpp"

namespace pw {
struct HttpProbeOptions {
    long connect_timeout_s{5};
    long total_timeout_s{10};
};

// GET via libcurl, one easy handle per request so concurrent loops share nothing.
// Phase split follows the curl timing points:
//   dns   = namelookup
//   tcp   = connect - namelookup
//   tls   = appconnect - connect (zero for plain http)
//   reply = starttransfer - max(connect, appconnect)
//   close = total - starttransfer
class HttpProbe : public Probe {
   public:
    HttpProbe(const std::string& location, const HttpProbeOptions& opts);
    bool fetch(const std::string& url, Sample& out, std::string& err) override;

   private:
    std::string location_;
    HttpProbeOptions opts_;
};
}  // namespace pw
