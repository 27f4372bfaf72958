#pragma once
#include "Rule.h"
#include <string>
#include <vector>

namespace secret_guard {

// Ordered rule list. Registration order is evaluation order: the first rule that
// matches a line names the finding for that line.
class RuleRegistry {
public:
    // Compiles and appends a rule. Throws RuleError on a bad expression or a duplicate name.
    void add(const std::string& name, const std::string& expression, bool icase = false,
             std::vector<std::string> excluded_prefixes = {}, std::vector<std::string> triggers = {});

    const std::vector<Rule>& rules() const { return rules_; }
    const Rule* find(const std::string& name) const;
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    // Canonical rule set minus the names in `disabled`. Throws RuleError for a name
    // in `disabled` that is not part of the canonical set.
    static RuleRegistry build_default(const std::vector<std::string>& disabled = {});
    static std::vector<std::string> default_rule_names();

private:
    std::vector<Rule> rules_;
};

} // namespace secret_guard
