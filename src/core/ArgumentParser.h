#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace secret_guard {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when the program should exit right away:
    // after --help / --version (exit_code() == 0) or on a bad argument (exit_code() == 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help() const;
    static void print_usage();

private:
    enum class ArgKind { None, String, Int, CSV, OptionalString };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* value_name;
        const char* help;
        std::function<bool(Config&, const std::string&)> apply;
    };

    const FlagSpec* find_spec(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
};

} // namespace secret_guard
