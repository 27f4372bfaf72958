#pragma once
#include "../core/Finding.h"
#include "../core/RuleRegistry.h"

namespace secret_guard {

// Line-oriented classifier. Holds a reference to the registry, which must outlive it.
class ContentScanner {
public:
    explicit ContentScanner(const RuleRegistry& registry) : registry_(registry) {}

    std::vector<Finding> scan(const ScanTarget& target) const;

    // First matching rule for one line, or null. Comment suppression is not applied here.
    const Rule* classify(const std::string& line) const;

    // True when the line, after leading whitespace, starts with #, //, /*, * or <!--.
    static bool is_comment_line(const std::string& line);

private:
    const RuleRegistry& registry_;
};

} // namespace secret_guard
