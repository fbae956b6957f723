#include <cassert>

#include "../src/monitor/summary.hpp"
#include "fakes.hpp"

int main() {
    using pw_test::make_sample;
    using namespace std::chrono_literals;
    auto t0 = pw::WallClock::now();

    pw::RunningSummary sum(make_sample("https://a.example/", 10, t0));
    sum.add(make_sample("https://a.example/", 20, t0 + 10s));
    sum.add(make_sample("https://a.example/", 30, t0 + 20s));
    if (sum.count() != 3) return 1;

    auto r = sum.finalize(t0 + 65s);
    if (r.count != 3) return 2;
    if (r.avg_resp_ms != 20.0) return 3;
    if (r.avg_dns_ms != 2.0) return 4;
    if (r.avg_tcp_ms != 4.0) return 5;
    if (r.elapsed_s != 65) return 6;
    if (r.avg_size != 1000) return 7;
    if (r.url != "https://a.example/" || r.remote != "192.0.2.1") return 8;

    // Status code and remote come from the first sample and stay as they were.
    pw::Sample later = make_sample("https://a.example/", 40, t0 + 30s);
    later.resp_code = 503;
    later.remote = "198.51.100.7";
    pw::Sample first = make_sample("https://a.example/", 40, t0);
    first.resp_code = 301;
    pw::RunningSummary kept(first);
    kept.add(later);
    auto rk = kept.finalize(t0 + 40s);
    if (rk.resp_code != 301 || rk.remote != "192.0.2.1") return 9;
    if (r.resp_code != 200) return 10;

    // Sum of uneven values: average is one division of the exact integer sum.
    pw::Sample a = make_sample("u", 0, t0), b = make_sample("u", 0, t0);
    a.total = std::chrono::nanoseconds(1);
    b.total = std::chrono::nanoseconds(2);
    a.size = 3;
    b.size = 4;
    pw::RunningSummary odd(a);
    odd.add(b);
    auto ro = odd.finalize(t0);
    assert(ro.avg_resp_ms == 3.0 / (1e6 * 2.0));
    assert(ro.avg_size == 3);

    // Finalizing twice gives the same report; nothing was mutated.
    auto r2 = sum.finalize(t0 + 65s);
    assert(r2.avg_resp_ms == r.avg_resp_ms && r2.count == r.count);
    return 0;
}
