#pragma once
#include "Report.h"
#include <ostream>

namespace secret_guard {

// Human-readable alert: nothing when the report is clean, otherwise a banner followed by
// one "<path>:<line> - Potential <rule>" line per finding.
class TextWriter {
public:
    void write(const Report& report, std::ostream& os) const;
    static std::string format_finding(const Finding& f);
};

} // namespace secret_guard
