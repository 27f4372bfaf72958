#include "ArgumentParser.h"
#include "BuildInfo.h"
#include "Utils.h"
#include <iostream>
#include <stdexcept>

namespace secret_guard {

namespace {

bool parse_int(const std::string& v, const char* flag, long long& out) {
    try {
        size_t used = 0;
        out = std::stoll(v, &used);
        if(used != v.size()) throw std::invalid_argument(v);
        return true;
    } catch(const std::exception&) {
        std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
        return false;
    }
}

} // end anonymous namespace

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--json", ArgKind::None, "", "Emit a JSON report", [](Config& c, const std::string&){ c.json = true; return true; }},
        {"--sarif", ArgKind::None, "", "Emit SARIF 2.1.0 JSON", [](Config& c, const std::string&){ c.sarif = true; return true; }},
        {"--pretty", ArgKind::None, "", "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; return true; }},
        {"--compact", ArgKind::None, "", "Minified JSON output", [](Config& c, const std::string&){ c.compact = true; return true; }},
        {"--output", ArgKind::String, "FILE", "Write the report to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; return true; }},
        {"--max-file-size", ArgKind::Int, "N", "Skip files larger than N bytes (default 1048576)", [](Config& c, const std::string& v){
            long long n = 0; if(!parse_int(v, "--max-file-size", n)) return false;
            if(n <= 0) { std::cerr << "--max-file-size must be positive\n"; return false; }
            c.max_file_size = static_cast<std::uintmax_t>(n); return true; }},
        {"--parallel", ArgKind::None, "", "Scan files on a worker pool", [](Config& c, const std::string&){ c.parallel = true; return true; }},
        {"--parallel-threads", ArgKind::Int, "N", "Worker count (0 = hardware concurrency)", [](Config& c, const std::string& v){
            long long n = 0; if(!parse_int(v, "--parallel-threads", n)) return false;
            if(n < 0 || n > 1024) { std::cerr << "--parallel-threads out of range: " << v << "\n"; return false; }
            c.parallel_max_threads = static_cast<int>(n); return true; }},
        {"--hash", ArgKind::None, "", "Include SHA256 of scanned files", [](Config& c, const std::string&){ c.hash_files = true; return true; }},
        {"--disable-rules", ArgKind::CSV, "LIST", "Comma-separated rule names to skip", [](Config& c, const std::string& v){
            auto names = utils::split_csv(v); c.disable_rules.insert(c.disable_rules.end(), names.begin(), names.end()); return true; }},
        {"--list-rules", ArgKind::None, "", "Print rule names in evaluation order", [](Config& c, const std::string&){ c.list_rules = true; return true; }},
        {"--log-level", ArgKind::String, "LEVEL", "error|warn|info|debug|trace (default warn)", [](Config& c, const std::string& v){ c.log_level = v; return true; }},
        {"--install-hook", ArgKind::OptionalString, "[DIR]", "Install the git pre-commit hook into repo DIR", [](Config& c, const std::string& v){
            c.install_hook = true; if(!v.empty()) c.hook_repo = v; return true; }},
        {"--force", ArgKind::None, "", "Replace an existing pre-commit hook", [](Config& c, const std::string&){ c.force = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_usage() {
    std::cerr << "Usage: secret-guard [options] FILE...\n"
              << "Try 'secret-guard --help' for more information.\n";
}

void ArgumentParser::print_help() const {
    std::cout << "Usage: secret-guard [options] FILE...\n\n"
              << "Scans files for credentials, keys and tokens before they are committed.\n\n"
              << "Options:\n";
    auto line = [](const std::string& name, const std::string& help){
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i = name.size(); i < 30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << help << "\n";
    };
    for(const auto& s : specs_) {
        std::string name = s.name;
        if(s.value_name[0]) name += std::string(" ") + s.value_name;
        line(name, s.help);
    }
    line("--version", "Print version & exit");
    line("--help", "Show this help");
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    bool options_done = false;
    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if(options_done || a.empty() || a[0] != '-' || a == "-") { cfg.files.push_back(a); continue; }
        if(a == "--") { options_done = true; continue; }
        if(a == "--help" || a == "-h") { print_help(); return false; }
        if(a == "--version") {
            std::cout << "secret-guard " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
                      << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
                      << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            return false;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec) { std::cerr << "Unknown arg: " << a << "\n"; print_usage(); exit_code_ = 2; return false; }
        std::string val;
        switch(spec->kind) {
            case ArgKind::None: break;
            case ArgKind::String: case ArgKind::Int: case ArgKind::CSV: {
                if(i + 1 >= argc) { std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
                val = argv[++i];
                break;
            }
            case ArgKind::OptionalString: {
                if(i + 1 < argc && argv[i+1][0] != '-') val = argv[++i];
                break;
            }
        }
        if(!spec->apply(cfg, val)) { exit_code_ = 2; return false; }
    }
    return true;
}

} // namespace secret_guard
