#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace secret_guard {

struct Finding {
    std::string path;
    size_t line_number = 0; // 1-based
    std::string rule_name;

    bool operator==(const Finding& o) const {
        return path == o.path && line_number == o.line_number && rule_name == o.rule_name;
    }
    bool operator!=(const Finding& o) const { return !(*this == o); }
};

struct ScanTarget {
    std::string path;
    std::string content;
};

enum class FileStatus { Scanned, Missing, NotRegular, Oversized, NotText, ReadError };

const char* to_string(FileStatus status);

struct FileResult {
    std::string path;
    FileStatus status = FileStatus::Scanned;
    std::uintmax_t size_bytes = 0;
    std::string sha256; // hex, only with --hash
    std::vector<Finding> findings;
};

} // namespace secret_guard
