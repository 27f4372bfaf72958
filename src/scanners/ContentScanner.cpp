#include "ContentScanner.h"
#include "../core/Utils.h"

namespace secret_guard {

namespace {
const char* const kCommentMarkers[] = {"#", "//", "/*", "*", "<!--"};
} // end anonymous namespace

bool ContentScanner::is_comment_line(const std::string& line) {
    size_t i = 0;
    while(i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r' || line[i] == '\f' || line[i] == '\v')) ++i;
    for(const char* marker : kCommentMarkers) {
        if(line.compare(i, std::char_traits<char>::length(marker), marker) == 0) return true;
    }
    return false;
}

const Rule* ContentScanner::classify(const std::string& line) const {
    for(const auto& rule : registry_.rules()) {
        if(rule.matches(line)) return &rule;
    }
    return nullptr;
}

std::vector<Finding> ContentScanner::scan(const ScanTarget& target) const {
    std::vector<Finding> findings;
    auto lines = utils::split_lines(target.content);
    for(size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if(line.empty() || is_comment_line(line)) continue;
        if(const Rule* rule = classify(line)) {
            findings.push_back(Finding{target.path, i + 1, rule->name});
        }
    }
    return findings;
}

} // namespace secret_guard
