#include "store_jsonl.hpp"
#include "../util/json.hpp"
#include "logger.hpp"

namespace pw {
JsonlStore::JsonlStore(const std::string& path) : out_(path, std::ios::app) {
    is_open_ = out_.is_open();
    if (!is_open_) {
        log(LogLevel::ERROR, "JsonlStore failed to open output file: " + path);
    }
}
JsonlStore::~JsonlStore() {
    if (is_open_) out_.flush();
}

void JsonlStore::write_json(const MetricEvent& ev) {
    if (!is_open_) return;
    out_ << "{";
    out_ << "\"ts_wall\":\"" << json_escape(ev.ts_wall) << "\",";
    out_ << "\"metric\":\"resp_time\",";
    out_ << "\"location\":\"" << json_escape(ev.location) << "\",";
    out_ << "\"url\":\"" << json_escape(ev.url) << "\",";
    out_ << "\"resp_code\":\"" << json_escape(ev.resp_code) << "\",";
    out_ << "\"value_ms\":" << json_number(ev.resp_ms);
    out_ << "}\n";
    out_.flush();
    if (!out_) {
        log(LogLevel::WARN, "JsonlStore write failed, disabling metrics output");
        is_open_ = false;
    }
}

void JsonlStore::on_metric(const MetricEvent& ev) { write_json(ev); }
}  // namespace pw
