#pragma once
#include "Config.h"
#include "Report.h"
#include "RuleRegistry.h"
#include "../scanners/ContentScanner.h"
#include "../scanners/FileLoader.h"

namespace secret_guard {

// Loads and scans each path. Results land in the report at the path's argument index,
// so a parallel run yields the same report as a sequential one.
class ScanRunner {
public:
    ScanRunner(const RuleRegistry& registry, const Config& cfg);

    void run(const std::vector<std::string>& paths, Report& report) const;
    // Never throws: unexpected failures become FileStatus::ReadError.
    FileResult scan_path(const std::string& path) const;

private:
    void run_sequential(const std::vector<std::string>& paths, Report& report) const;
    void run_parallel(const std::vector<std::string>& paths, Report& report, size_t workers) const;

    const Config& cfg_;
    ContentScanner scanner_;
    FileLoader loader_;
};

} // namespace secret_guard
