#include "Report.h"

namespace secret_guard {

const char* to_string(FileStatus status) {
    switch(status) {
        case FileStatus::Scanned: return "scanned";
        case FileStatus::Missing: return "missing";
        case FileStatus::NotRegular: return "not_regular";
        case FileStatus::Oversized: return "oversized";
        case FileStatus::NotText: return "not_text";
        case FileStatus::ReadError: return "read_error";
    }
    return "unknown";
}

void Report::set_result(size_t index, FileResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if(index >= results_.size()) results_.resize(index + 1);
    results_[index] = std::move(result);
}

void Report::add_result(FileResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(std::move(result));
}

void Report::set_times(std::chrono::system_clock::time_point start, std::chrono::system_clock::time_point end) {
    start_ = start;
    end_ = end;
}

std::vector<Finding> Report::findings() const {
    std::vector<Finding> out;
    for(const auto& r : results_) out.insert(out.end(), r.findings.begin(), r.findings.end());
    return out;
}

size_t Report::finding_count() const {
    size_t total = 0;
    for(const auto& r : results_) total += r.findings.size();
    return total;
}

size_t Report::count_status(FileStatus status) const {
    size_t n = 0;
    for(const auto& r : results_) if(r.status == status) ++n;
    return n;
}

} // namespace secret_guard
