#include "JsonUtil.h"
#include "Utils.h"
#include <cstdio>
#include <ctime>

namespace secret_guard {
namespace jsonutil {

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    size_t i = 0;
    while(i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if(c >= 0x80) {
            // ill-formed bytes become U+FFFD so the document stays valid JSON
            size_t len = utils::utf8_sequence_length(s, i);
            if(len == 0) { out += "\\ufffd"; ++i; }
            else { out.append(s, i, len); i += len; }
            continue;
        }
        switch(c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
        ++i;
    }
    return out;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp) {
    if(tp.time_since_epoch().count() == 0) return "";
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace jsonutil
} // namespace secret_guard
