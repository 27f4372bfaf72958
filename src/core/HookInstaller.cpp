#include "HookInstaller.h"
#include "Logging.h"
#include "Utils.h"
#include <fstream>

namespace fs = std::filesystem;
namespace secret_guard {

std::string HookInstaller::shell_quote(const std::string& s) {
    std::string out = "'";
    for(char c : s) {
        if(c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

std::string HookInstaller::render_script(const std::string& binary_path) {
    std::string bin = shell_quote(binary_path);
    return
        "#!/bin/sh\n"
        "# Installed by secret-guard --install-hook\n"
        "git diff --cached --name-only --diff-filter=ACM -z | xargs -0 -r " + bin + " --\n"
        "status=$?\n"
        "if [ \"$status\" -eq 0 ]; then\n"
        "    exit 0\n"
        "fi\n"
        "if ! exec < /dev/tty 2>/dev/null; then\n"
        "    echo \"secret-guard: no terminal available, commit blocked.\" >&2\n"
        "    exit 1\n"
        "fi\n"
        "printf 'Commit anyway? [y/N] '\n"
        "read -r answer\n"
        "case \"$answer\" in\n"
        "    y|Y|yes|YES) exit 0 ;;\n"
        "    *) echo \"Commit aborted.\"; exit 1 ;;\n"
        "esac\n";
}

fs::path HookInstaller::git_dir() const {
    std::error_code ec;
    fs::path dot_git = repo_root_ / ".git";
    if(fs::is_directory(dot_git, ec)) return dot_git;
    if(!fs::is_regular_file(dot_git, ec)) return {};
    // worktrees and submodules: ".git" is a file holding "gitdir: <path>"
    auto content = utils::read_file(dot_git.string(), 4096);
    if(!content) return {};
    std::string line = utils::trim(*content);
    const std::string key = "gitdir:";
    if(!utils::starts_with(line, key)) return {};
    fs::path target = utils::trim(line.substr(key.size()));
    if(target.is_relative()) target = repo_root_ / target;
    return fs::is_directory(target, ec) ? target : fs::path{};
}

fs::path HookInstaller::hook_path() const {
    auto gd = git_dir();
    if(gd.empty()) return {};
    return gd / "hooks" / "pre-commit";
}

bool HookInstaller::install(const std::string& binary_path, bool force, std::string& error) const {
    auto hook = hook_path();
    if(hook.empty()) {
        error = "not a git repository: " + repo_root_.string();
        return false;
    }
    std::error_code ec;
    fs::create_directories(hook.parent_path(), ec);
    if(ec) {
        error = "cannot create " + hook.parent_path().string() + ": " + ec.message();
        return false;
    }
    if(fs::exists(hook, ec)) {
        if(!force) {
            error = "pre-commit hook already exists: " + hook.string() + " (use --force to replace it)";
            return false;
        }
        fs::path backup = hook;
        backup += ".bak";
        fs::rename(hook, backup, ec);
        if(ec) {
            error = "cannot back up existing hook: " + ec.message();
            return false;
        }
        Logger::instance().info("existing hook saved as " + backup.string());
    }
    {
        std::ofstream ofs(hook, std::ios::binary | std::ios::trunc);
        if(!ofs) {
            error = "cannot write " + hook.string();
            return false;
        }
        ofs << render_script(binary_path);
        if(!ofs) {
            error = "write failed for " + hook.string();
            return false;
        }
    }
    fs::permissions(hook, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec, fs::perm_options::replace, ec);
    if(ec) {
        error = "cannot make hook executable: " + ec.message();
        return false;
    }
    Logger::instance().info("installed pre-commit hook at " + hook.string());
    return true;
}

} // namespace secret_guard
