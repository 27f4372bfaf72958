#pragma once
#include "Config.h"
#include "Report.h"
#include "RuleRegistry.h"
#include <string>

namespace secret_guard {

class JSONWriter {
public:
    // JSON report, or SARIF 2.1.0 when cfg.sarif is set. Compact unless cfg.pretty.
    std::string write(const Report& report, const RuleRegistry& registry, const Config& cfg) const;
};

} // namespace secret_guard
