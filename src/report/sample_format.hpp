#pragma once
#include <cstdint>
#include <string>

#include "../probes/probe.hpp"

namespace pw {
struct SummaryReport;

// Column header shared by sample lines and the summary block.
std::string text_header();

// "<seq>\t<dns>\t<tcp>\t<tls>\t<reply>\t<close>\t<resp>\t<code>\t<size>\t<remote>\t<location>\t<url>"
std::string sample_tsv(int64_t seq, const Sample& s);

// One compact JSON object, no trailing newline. Also the webhook payload.
std::string sample_json(const Sample& s);

// "Recorded N samples in 1m05s, average values:" plus header and average line.
std::string summary_text(const SummaryReport& r);

// Status code as published to metrics: "%03d", or "0" for no response.
std::string metric_resp_code(int resp_code);
}  // namespace pw
