#pragma once
#include "../core/Finding.h"
#include <optional>

namespace secret_guard {

constexpr std::uintmax_t kDefaultMaxFileSize = 1024 * 1024;

struct LoadResult {
    FileStatus status = FileStatus::Scanned;
    std::uintmax_t size_bytes = 0;
    std::optional<ScanTarget> target; // set only when status == Scanned
    std::string sha256; // raw file bytes, only when hashing is enabled
};

// Caller-side gate in front of the content scanner: only existing regular files of at
// most max_bytes whose bytes are valid UTF-8 produce a ScanTarget. Never throws for
// missing or unreadable files.
class FileLoader {
public:
    explicit FileLoader(std::uintmax_t max_bytes = kDefaultMaxFileSize, bool hash = false)
        : max_bytes_(max_bytes), hash_(hash) {}

    LoadResult load(const std::string& path) const;
    std::uintmax_t max_bytes() const { return max_bytes_; }

private:
    std::uintmax_t max_bytes_;
    bool hash_;
};

} // namespace secret_guard
