#include "Rule.h"
#include "Utils.h"
#include <algorithm>
#include <cctype>

namespace secret_guard {

namespace {

bool contains_folded(const std::string& line, const std::string& needle) {
    auto it = std::search(line.begin(), line.end(), needle.begin(), needle.end(), [](char a, char b){
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
    return it != line.end();
}

} // end anonymous namespace

bool Rule::may_match(const std::string& line) const {
    if(triggers.empty()) return true;
    for(const auto& t : triggers) {
        if(icase ? contains_folded(line, t) : line.find(t) != std::string::npos) return true;
    }
    return false;
}

bool Rule::matches(const std::string& line) const {
    if(!may_match(line)) return false;
    if(excluded_prefixes.empty()) return std::regex_search(line, pattern);

    size_t pos = 0;
    std::smatch m;
    while(pos <= line.size()) {
        auto flags = pos > 0 ? std::regex_constants::match_prev_avail : std::regex_constants::match_default;
        if(!std::regex_search(line.cbegin() + static_cast<std::ptrdiff_t>(pos), line.cend(), m, pattern, flags)) return false;
        size_t start = pos + static_cast<size_t>(m.position(0));
        bool excluded = false;
        for(const auto& prefix : excluded_prefixes) {
            if(utils::ends_with(line, start, prefix)) { excluded = true; break; }
        }
        if(!excluded) return true;
        pos = start + 1;
    }
    return false;
}

} // namespace secret_guard
