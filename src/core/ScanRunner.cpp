#include "ScanRunner.h"
#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <thread>

namespace secret_guard {

ScanRunner::ScanRunner(const RuleRegistry& registry, const Config& cfg)
    : cfg_(cfg), scanner_(registry), loader_(cfg.max_file_size, cfg.hash_files) {}

FileResult ScanRunner::scan_path(const std::string& path) const {
    FileResult fr;
    fr.path = path;
    try {
        auto loaded = loader_.load(path);
        fr.status = loaded.status;
        fr.size_bytes = loaded.size_bytes;
        fr.sha256 = std::move(loaded.sha256);
        if(loaded.target) {
            fr.findings = scanner_.scan(*loaded.target);
            Logger::instance().debug("scanned " + path + ": " + std::to_string(fr.findings.size()) + " finding(s)");
        }
    } catch(const std::exception& ex) {
        Logger::instance().warn("skip " + path + ": " + ex.what());
        fr.status = FileStatus::ReadError;
        fr.findings.clear();
    }
    return fr;
}

void ScanRunner::run(const std::vector<std::string>& paths, Report& report) const {
    auto start = std::chrono::system_clock::now();
    size_t workers = 1;
    if(cfg_.parallel) {
        workers = cfg_.parallel_max_threads > 0 ? static_cast<size_t>(cfg_.parallel_max_threads)
                                                : std::max(1u, std::thread::hardware_concurrency());
        workers = std::min(workers, paths.size());
    }
    if(workers > 1) run_parallel(paths, report, workers);
    else run_sequential(paths, report);
    report.set_times(start, std::chrono::system_clock::now());
}

void ScanRunner::run_sequential(const std::vector<std::string>& paths, Report& report) const {
    for(size_t i = 0; i < paths.size(); ++i) {
        report.set_result(i, scan_path(paths[i]));
    }
}

void ScanRunner::run_parallel(const std::vector<std::string>& paths, Report& report, size_t workers) const {
    Logger::instance().debug("scanning " + std::to_string(paths.size()) + " file(s) on " + std::to_string(workers) + " threads");
    std::vector<FileResult> slots(paths.size());
    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for(size_t t = 0; t < workers; ++t) {
        pool.emplace_back([&]{
            for(size_t i = next.fetch_add(1); i < paths.size(); i = next.fetch_add(1)) {
                slots[i] = scan_path(paths[i]);
            }
        });
    }
    for(auto& th : pool) th.join();
    for(size_t i = 0; i < slots.size(); ++i) report.set_result(i, std::move(slots[i]));
}

} // namespace secret_guard
