#pragma once
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace secret_guard {

// Raised while building a registry: bad expression, duplicate or unknown rule name.
class RuleError : public std::runtime_error {
public:
    RuleError(const std::string& rule, const std::string& message)
        : std::runtime_error(rule + ": " + message), rule_(rule) {}
    const std::string& rule() const { return rule_; }
private:
    std::string rule_;
};

struct Rule {
    std::string name;
    std::string expression; // source text, kept for diagnostics and SARIF
    std::regex pattern;
    // A match immediately preceded by one of these is rejected and the search resumes
    // one character further (stands in for look-behind, which ECMAScript regex lacks).
    std::vector<std::string> excluded_prefixes;
    // Literals of which at least one must occur in the line before the pattern runs.
    // Folded to lowercase for case-insensitive rules. Empty means always run.
    std::vector<std::string> triggers;
    bool icase = false;

    bool may_match(const std::string& line) const;
    bool matches(const std::string& line) const;
};

} // namespace secret_guard
