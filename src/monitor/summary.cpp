#include "summary.hpp"

namespace pw {
namespace {
double avg_ms(std::chrono::nanoseconds sum, int64_t count) {
    return static_cast<double>(sum.count()) / (1e6 * static_cast<double>(count));
}
}  // namespace

RunningSummary::RunningSummary(const Sample& first)
    : url_(first.url), location_(first.location), remote_(first.remote),
      resp_code_(first.resp_code),
      start_(first.start) {
    add(first);
}

void RunningSummary::add(const Sample& s) {
    dns_ += s.dns;
    tcp_ += s.tcp;
    tls_ += s.tls;
    reply_ += s.reply;
    close_ += s.close;
    total_ += s.total;
    size_ += s.size;
    ++count_;
}

SummaryReport RunningSummary::finalize(WallClock::time_point now) const {
    SummaryReport r;
    r.url = url_;
    r.location = location_;
    r.remote = remote_;
    r.resp_code = resp_code_;
    r.count = count_;
    r.elapsed_s = std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();
    if (count_ == 0) return r;
    r.avg_dns_ms = avg_ms(dns_, count_);
    r.avg_tcp_ms = avg_ms(tcp_, count_);
    r.avg_tls_ms = avg_ms(tls_, count_);
    r.avg_reply_ms = avg_ms(reply_, count_);
    r.avg_close_ms = avg_ms(close_, count_);
    r.avg_resp_ms = avg_ms(total_, count_);
    r.avg_size = size_ / count_;
    return r;
}
}  // namespace pw
