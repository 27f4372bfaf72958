#include "FileLoader.h"
#include "../core/Digest.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;
namespace secret_guard {

LoadResult FileLoader::load(const std::string& path) const {
    LoadResult res;
    auto& log = Logger::instance();
    std::error_code ec;
    auto st = fs::status(path, ec);
    if(ec || !fs::exists(st)) {
        log.debug("skip " + path + ": no such file");
        res.status = FileStatus::Missing;
        return res;
    }
    if(!fs::is_regular_file(st)) {
        log.debug("skip " + path + ": not a regular file");
        res.status = FileStatus::NotRegular;
        return res;
    }
    res.size_bytes = fs::file_size(path, ec);
    if(ec) {
        log.debug("skip " + path + ": " + ec.message());
        res.status = FileStatus::ReadError;
        return res;
    }
    if(res.size_bytes > max_bytes_) {
        log.debug("skip " + path + ": " + std::to_string(res.size_bytes) + " bytes exceeds limit");
        res.status = FileStatus::Oversized;
        return res;
    }
    // One byte past the limit detects a file that grew after the size check.
    size_t read_limit = max_bytes_ < SIZE_MAX ? static_cast<size_t>(max_bytes_) + 1 : SIZE_MAX;
    auto content = utils::read_file(path, read_limit);
    if(!content) {
        log.debug("skip " + path + ": read failed");
        res.status = FileStatus::ReadError;
        return res;
    }
    if(content->size() > max_bytes_) {
        log.debug("skip " + path + ": grew past limit while reading");
        res.status = FileStatus::Oversized;
        return res;
    }
    if(!utils::is_valid_utf8(*content)) {
        log.debug("skip " + path + ": not UTF-8 text");
        res.status = FileStatus::NotText;
        return res;
    }
    if(hash_) res.sha256 = sha256_hex(*content);
    if(utils::starts_with(*content, "\xEF\xBB\xBF")) content->erase(0, 3);
    res.target = ScanTarget{path, std::move(*content)};
    return res;
}

} // namespace secret_guard
