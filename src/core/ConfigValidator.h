#pragma once
#include "Config.h"

namespace secret_guard {

class ConfigValidator {
public:
    // Normalizes cfg in place; prints the reason to stderr and returns false on conflicts.
    bool validate(Config& cfg);

private:
    bool validate_log_level(const std::string& level) const;
    bool validate_rule_names(const std::vector<std::string>& names) const;
};

} // namespace secret_guard
