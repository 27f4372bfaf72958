#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace secret_guard {

struct Config {
    std::vector<std::string> files; // positional arguments, scanned in this order
    std::string output_file; // empty = stdout
    bool json = false;
    bool sarif = false;
    bool pretty = false;
    bool compact = false; // wins over pretty when both are set
    std::uintmax_t max_file_size = 1024 * 1024; // larger files are skipped
    bool parallel = false;
    int parallel_max_threads = 0; // 0 = hardware concurrency
    bool hash_files = false; // SHA256 of scanned files in JSON/SARIF output
    std::vector<std::string> disable_rules;
    bool list_rules = false;
    std::string log_level = "warn";
    // Hook installation
    bool install_hook = false;
    std::string hook_repo = ".";
    bool force = false;
};

} // namespace secret_guard
