#include "ConfigValidator.h"
#include "Logging.h"
#include "RuleRegistry.h"
#include <algorithm>
#include <iostream>

namespace secret_guard {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(cfg.json && cfg.sarif) {
        std::cerr << "--json and --sarif are mutually exclusive\n";
        return false;
    }

    if(!validate_log_level(cfg.log_level)) {
        return false;
    }

    if(cfg.max_file_size == 0) {
        std::cerr << "--max-file-size must be positive\n";
        return false;
    }

    if(cfg.parallel_max_threads < 0) {
        std::cerr << "--parallel-threads must not be negative\n";
        return false;
    }

    if(!validate_rule_names(cfg.disable_rules)) {
        return false;
    }

    if(cfg.force && !cfg.install_hook) {
        std::cerr << "--force requires --install-hook\n";
        return false;
    }

    if(cfg.install_hook && cfg.hook_repo.empty()) {
        std::cerr << "--install-hook requires a repository directory\n";
        return false;
    }

    return true;
}

bool ConfigValidator::validate_log_level(const std::string& level) const {
    LogLevel parsed;
    if(!parse_log_level(level, parsed)) {
        std::cerr << "Invalid --log-level value: " << level << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_rule_names(const std::vector<std::string>& names) const {
    auto known = RuleRegistry::default_rule_names();
    for(const auto& n : names) {
        if(std::find(known.begin(), known.end(), n) == known.end()) {
            std::cerr << "Unknown rule name in --disable-rules: " << n << "\n";
            return false;
        }
    }
    if(names.size() >= known.size() && std::all_of(known.begin(), known.end(), [&](const std::string& k){
            return std::find(names.begin(), names.end(), k) != names.end(); })) {
        std::cerr << "--disable-rules would disable every rule\n";
        return false;
    }
    return true;
}

} // namespace secret_guard
