#include "core/RuleRegistry.h"
#include "core/Utils.h"
#include "scanners/ContentScanner.h"
#include <cstdint>
#include <string>

// Feeds arbitrary bytes through the same path as a loaded file: UTF-8 gate, then the
// line scanner. Findings must stay one per line and in line order.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const secret_guard::RuleRegistry registry = secret_guard::RuleRegistry::build_default();
    static const secret_guard::ContentScanner scanner(registry);

    std::string content(reinterpret_cast<const char*>(data), size);
    if (!secret_guard::utils::is_valid_utf8(content)) return 0;

    auto findings = scanner.scan(secret_guard::ScanTarget{"fuzz.txt", content});
    size_t last = 0;
    for (const auto& f : findings) {
        if (f.line_number <= last) __builtin_trap();
        last = f.line_number;
    }
    return 0;
}
