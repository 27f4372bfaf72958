#pragma once
#include "Finding.h"
#include <chrono>
#include <mutex>

namespace secret_guard {

// Per-file results of one invocation, kept in argument order.
class Report {
public:
    // Stores the result for argument index `index`; grows the slot list when needed.
    void set_result(size_t index, FileResult result);
    void add_result(FileResult result);

    void set_times(std::chrono::system_clock::time_point start, std::chrono::system_clock::time_point end);

    const std::vector<FileResult>& results() const { return results_; }
    // FindingSet: argument order first, then ascending line number.
    std::vector<Finding> findings() const;
    size_t finding_count() const;
    size_t count_status(FileStatus status) const;
    bool has_findings() const { return finding_count() > 0; }

    std::chrono::system_clock::time_point start_time() const { return start_; }
    std::chrono::system_clock::time_point end_time() const { return end_; }

private:
    std::vector<FileResult> results_;
    std::chrono::system_clock::time_point start_{};
    std::chrono::system_clock::time_point end_{};
    std::mutex mutex_;
};

} // namespace secret_guard
