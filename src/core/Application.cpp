#include "Application.h"
#include "ArgumentParser.h"
#include "ConfigValidator.h"
#include "HookInstaller.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "ScanRunner.h"
#include "TextWriter.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <unistd.h>
#include <limits.h>

namespace secret_guard {

namespace {

std::string self_executable(const char* argv0) {
    char pathbuf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", pathbuf, sizeof(pathbuf) - 1);
    if(n > 0) { pathbuf[n] = 0; return pathbuf; }
    return argv0 ? argv0 : "secret-guard";
}

int install_hook(const Config& cfg, const char* argv0) {
    HookInstaller installer(cfg.hook_repo);
    std::string error;
    if(!installer.install(self_executable(argv0), cfg.force, error)) {
        Logger::instance().error(error);
        return kExitHookError;
    }
    std::cout << "Installed pre-commit hook: " << installer.hook_path().string() << "\n";
    return kExitClean;
}

} // end anonymous namespace

int Application::run(int argc, char** argv) {
    return run(argc, argv, std::cout);
}

int Application::run(int argc, char** argv, std::ostream& out) {
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    if(!validator.validate(cfg)) return kExitBadArgs;

    LogLevel level = LogLevel::Warn;
    if(parse_log_level(cfg.log_level, level)) Logger::instance().set_level(level);

    std::optional<RuleRegistry> registry;
    try {
        registry = RuleRegistry::build_default(cfg.disable_rules);
    } catch(const RuleError& ex) {
        Logger::instance().error(std::string("invalid rule registry: ") + ex.what());
        return kExitRuleError;
    }

    if(cfg.list_rules) {
        for(const auto& rule : registry->rules()) out << rule.name << "\n";
        return kExitClean;
    }

    if(cfg.install_hook) {
        if(!cfg.files.empty()) Logger::instance().warn("file arguments are ignored with --install-hook");
        return install_hook(cfg, argc > 0 ? argv[0] : nullptr);
    }

    if(cfg.files.empty()) {
        ArgumentParser::print_usage();
        return kExitFindings;
    }

    Report report;
    ScanRunner runner(*registry, cfg);
    runner.run(cfg.files, report);
    Logger::instance().info("scanned " + std::to_string(report.count_status(FileStatus::Scanned)) + " of " +
                            std::to_string(report.results().size()) + " file(s), " +
                            std::to_string(report.finding_count()) + " finding(s)");

    std::ofstream file_out;
    std::ostream* os = &out;
    if(!cfg.output_file.empty()) {
        file_out.open(cfg.output_file, std::ios::trunc);
        if(!file_out) {
            Logger::instance().error("cannot open output file: " + cfg.output_file);
            return kExitBadArgs;
        }
        os = &file_out;
    }

    if(cfg.json || cfg.sarif) {
        JSONWriter writer;
        *os << writer.write(report, *registry, cfg);
    } else {
        TextWriter writer;
        writer.write(report, *os);
    }
    os->flush();

    return report.has_findings() ? kExitFindings : kExitClean;
}

} // namespace secret_guard
