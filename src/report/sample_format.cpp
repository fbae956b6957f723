#include "sample_format.hpp"

#include <cstdio>
#include <sstream>

#include "../monitor/summary.hpp"
#include "../util/json.hpp"

namespace pw {
namespace {
std::string ms3(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.03f", v);
    return std::string(buf);
}
}  // namespace

std::string text_header() {
    return "#\tDNS\tTCP\tTLS\tReply\tClose\tRespTime\tCode\tSize\tRemote\tLocation\tURL";
}

std::string sample_tsv(int64_t seq, const Sample& s) {
    std::ostringstream out;
    out << seq << '\t' << ms3(to_msec(s.dns)) << '\t' << ms3(to_msec(s.tcp)) << '\t'
        << ms3(to_msec(s.tls)) << '\t' << ms3(to_msec(s.reply)) << '\t' << ms3(to_msec(s.close))
        << '\t' << ms3(to_msec(s.resp_time())) << '\t' << s.resp_code << '\t' << s.size << '\t'
        << s.remote << '\t' << s.location << '\t' << s.url;
    return out.str();
}

std::string sample_json(const Sample& s) {
    std::ostringstream out;
    out << "{";
    out << "\"start\":\"" << wall_time_iso8601(s.start) << "\",";
    out << "\"url\":\"" << json_escape(s.url) << "\",";
    out << "\"location\":\"" << json_escape(s.location) << "\",";
    out << "\"remote\":\"" << json_escape(s.remote) << "\",";
    out << "\"dns_ms\":" << json_number(to_msec(s.dns)) << ",";
    out << "\"tcp_ms\":" << json_number(to_msec(s.tcp)) << ",";
    out << "\"tls_ms\":" << json_number(to_msec(s.tls)) << ",";
    out << "\"reply_ms\":" << json_number(to_msec(s.reply)) << ",";
    out << "\"close_ms\":" << json_number(to_msec(s.close)) << ",";
    out << "\"total_ms\":" << json_number(to_msec(s.total)) << ",";
    out << "\"resp_ms\":" << json_number(to_msec(s.resp_time())) << ",";
    out << "\"resp_code\":" << s.resp_code << ",";
    out << "\"size\":" << s.size;
    out << "}";
    return out.str();
}

std::string summary_text(const SummaryReport& r) {
    std::ostringstream out;
    std::string elapsed = hhmmss(r.elapsed_s);
    out << "\nRecorded " << r.count << " samples in " << elapsed << ", average values:\n";
    out << text_header() << "\n";
    out << r.count << ' ' << elapsed << '\t' << ms3(r.avg_dns_ms) << '\t' << ms3(r.avg_tcp_ms)
        << '\t' << ms3(r.avg_tls_ms) << '\t' << ms3(r.avg_reply_ms) << '\t'
        << ms3(r.avg_close_ms) << '\t' << ms3(r.avg_resp_ms) << '\t' << r.resp_code << '\t'
        << r.avg_size << '\t' << r.remote << '\t' << r.location << '\t' << r.url << "\n";
    return out.str();
}

std::string metric_resp_code(int resp_code) {
    if (resp_code < 0) return "0";
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03d", resp_code);
    return std::string(buf);
}
}  // namespace pw
