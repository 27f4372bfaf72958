#include "Utils.h"
#include <algorithm>
#include <fstream>

namespace secret_guard {
namespace utils {

std::optional<std::string> read_file(const std::string& path, size_t max_bytes) {
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return std::nullopt;
    std::string out;
    char buf[8192];
    while(out.size() < max_bytes) {
        size_t want = std::min(sizeof(buf), max_bytes - out.size());
        ifs.read(buf, static_cast<std::streamsize>(want));
        std::streamsize got = ifs.gcount();
        if(got > 0) out.append(buf, static_cast<size_t>(got));
        if(!ifs) break;
    }
    if(ifs.bad()) return std::nullopt;
    return out;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while(b < e && is_space(s[b])) ++b;
    while(e > b && is_space(s[e-1])) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while(start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = (nl == std::string::npos) ? content.size() : nl;
        size_t len = end - start;
        if(len > 0 && content[end-1] == '\r') --len;
        lines.emplace_back(content, start, len);
        if(nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out; std::string cur;
    for(char c : s) {
        if(c == ',') { cur = trim(cur); if(!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    cur = trim(cur);
    if(!cur.empty()) out.push_back(cur);
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, size_t end, const std::string& suffix) {
    if(end > s.size() || end < suffix.size()) return false;
    return s.compare(end - suffix.size(), suffix.size(), suffix) == 0;
}

size_t utf8_sequence_length(const std::string& data, size_t pos) {
    const auto* p = reinterpret_cast<const unsigned char*>(data.data());
    size_t n = data.size();
    if(pos >= n) return 0;
    unsigned char c = p[pos];
    if(c < 0x80) return 1;
    size_t len; uint32_t cp;
    if((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return 0;
    if(pos + len > n) return 0;
    for(size_t k = 1; k < len; ++k) {
        if((p[pos+k] & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (p[pos+k] & 0x3F);
    }
    if(len == 2 && cp < 0x80) return 0;
    if(len == 3 && cp < 0x800) return 0;
    if(len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return 0;
    if(cp >= 0xD800 && cp <= 0xDFFF) return 0;
    return len;
}

bool is_valid_utf8(const std::string& data) {
    size_t i = 0;
    while(i < data.size()) {
        size_t len = utf8_sequence_length(data, i);
        if(len == 0) return false;
        i += len;
    }
    return true;
}

} // namespace utils
} // namespace secret_guard
