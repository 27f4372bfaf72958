#pragma once
#include <ostream>

namespace secret_guard {

enum ExitCode : int {
    kExitClean = 0,
    kExitFindings = 1, // also returned for the no-files usage error
    kExitBadArgs = 2,
    kExitRuleError = 3,
    kExitHookError = 4,
};

class Application {
public:
    // Full command line run. The report goes to `out` unless --output names a file.
    int run(int argc, char** argv, std::ostream& out);
    int run(int argc, char** argv);
};

} // namespace secret_guard
