#pragma once
#include <filesystem>
#include <string>

namespace secret_guard {

// Writes the git pre-commit hook that runs secret-guard on staged files and asks on
// the terminal whether to commit anyway when it reports findings.
class HookInstaller {
public:
    explicit HookInstaller(std::filesystem::path repo_root) : repo_root_(std::move(repo_root)) {}

    // Returns false and sets error when the repository or hook cannot be written. An
    // existing hook is only replaced with force, and is then kept as pre-commit.bak.
    bool install(const std::string& binary_path, bool force, std::string& error) const;

    // <git-dir>/hooks/pre-commit; empty when repo_root is not a git work tree.
    std::filesystem::path hook_path() const;

    static std::string render_script(const std::string& binary_path);
    static std::string shell_quote(const std::string& s);

private:
    std::filesystem::path git_dir() const;

    std::filesystem::path repo_root_;
};

} // namespace secret_guard
