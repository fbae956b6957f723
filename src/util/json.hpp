#pragma once
#include <cstdio>
#include <string>

namespace pw {
inline std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// Fixed-precision number for JSON output (no exponent, no locale).
inline std::string json_number(double v, int precision = 3) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    return std::string(buf);
}

// Pulls the first string value of `key` out of a flat JSON document. Enough for
// reading single fields back from API replies; not a general parser.
inline bool extract_string(const std::string& doc, const std::string& key, std::string& out) {
    std::string needle = "\"" + key + "\"";
    auto pos = doc.find(needle);
    while (pos != std::string::npos) {
        size_t i = pos + needle.size();
        while (i < doc.size() && (doc[i] == ' ' || doc[i] == '\t' || doc[i] == '\n')) ++i;
        if (i < doc.size() && doc[i] == ':') {
            ++i;
            while (i < doc.size() && (doc[i] == ' ' || doc[i] == '\t' || doc[i] == '\n')) ++i;
            if (i < doc.size() && doc[i] == '"') {
                size_t end = doc.find('"', i + 1);
                if (end == std::string::npos) return false;
                out = doc.substr(i + 1, end - i - 1);
                return true;
            }
            return false;
        }
        pos = doc.find(needle, pos + 1);
    }
    return false;
}
}  // namespace pw
