#include "TextWriter.h"

namespace secret_guard {

std::string TextWriter::format_finding(const Finding& f) {
    return f.path + ":" + std::to_string(f.line_number) + " - Potential " + f.rule_name;
}

void TextWriter::write(const Report& report, std::ostream& os) const {
    auto findings = report.findings();
    if(findings.empty()) return;
    os << "WARNING: potential secrets detected (" << findings.size()
       << (findings.size() == 1 ? " finding" : " findings") << "). Review before committing:\n";
    for(const auto& f : findings) os << format_finding(f) << "\n";
}

} // namespace secret_guard
