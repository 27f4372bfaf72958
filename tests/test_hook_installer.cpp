#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/HookInstaller.h"
#include "../src/core/Utils.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace secret_guard {

class HookInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo = fs::temp_directory_path() / ("secret_guard_hook_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(repo);
        fs::create_directories(repo);
    }

    void TearDown() override {
        fs::remove_all(repo);
    }

    std::string read(const fs::path& p) {
        auto content = utils::read_file(p.string());
        return content ? *content : std::string();
    }

    fs::path repo;
};

TEST_F(HookInstallerTest, NotAGitRepository) {
    HookInstaller installer(repo);
    std::string error;
    EXPECT_FALSE(installer.install("/usr/bin/secret-guard", false, error));
    EXPECT_THAT(error, ::testing::HasSubstr("not a git repository"));
    EXPECT_TRUE(installer.hook_path().empty());
}

TEST_F(HookInstallerTest, InstallsExecutableHook) {
    fs::create_directories(repo / ".git");
    HookInstaller installer(repo);
    std::string error;
    ASSERT_TRUE(installer.install("/usr/local/bin/secret-guard", false, error)) << error;

    auto hook = repo / ".git" / "hooks" / "pre-commit";
    EXPECT_EQ(installer.hook_path().string(), hook.string());
    ASSERT_TRUE(fs::is_regular_file(hook));
    EXPECT_EQ(read(hook), HookInstaller::render_script("/usr/local/bin/secret-guard"));
    auto perms = fs::status(hook).permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_NE(perms & fs::perms::others_exec, fs::perms::none);
    EXPECT_EQ(perms & fs::perms::group_write, fs::perms::none);
}

TEST_F(HookInstallerTest, ExistingHookNeedsForce) {
    fs::create_directories(repo / ".git" / "hooks");
    auto hook = repo / ".git" / "hooks" / "pre-commit";
    { std::ofstream(hook) << "#!/bin/sh\nrun-linter\n"; }

    HookInstaller installer(repo);
    std::string error;
    EXPECT_FALSE(installer.install("secret-guard", false, error));
    EXPECT_THAT(error, ::testing::HasSubstr("already exists"));
    EXPECT_EQ(read(hook), "#!/bin/sh\nrun-linter\n");
}

TEST_F(HookInstallerTest, ForceKeepsBackup) {
    fs::create_directories(repo / ".git" / "hooks");
    auto hook = repo / ".git" / "hooks" / "pre-commit";
    { std::ofstream(hook) << "#!/bin/sh\nrun-linter\n"; }

    HookInstaller installer(repo);
    std::string error;
    ASSERT_TRUE(installer.install("secret-guard", true, error)) << error;
    EXPECT_EQ(read(repo / ".git" / "hooks" / "pre-commit.bak"), "#!/bin/sh\nrun-linter\n");
    EXPECT_THAT(read(hook), ::testing::HasSubstr("xargs -0 -r 'secret-guard' --\n"));
}

TEST_F(HookInstallerTest, GitFileWithRelativeGitdir) {
    fs::create_directories(repo / "actual-git-dir");
    { std::ofstream(repo / ".git") << "gitdir: actual-git-dir\n"; }
    HookInstaller installer(repo);
    EXPECT_EQ(installer.hook_path().string(), (repo / "actual-git-dir" / "hooks" / "pre-commit").string());
    std::string error;
    ASSERT_TRUE(installer.install("secret-guard", false, error)) << error;
    EXPECT_TRUE(fs::is_regular_file(repo / "actual-git-dir" / "hooks" / "pre-commit"));
}

TEST_F(HookInstallerTest, GitFileWithoutGitdirLine) {
    { std::ofstream(repo / ".git") << "garbage\n"; }
    EXPECT_TRUE(HookInstaller(repo).hook_path().empty());
}

TEST_F(HookInstallerTest, ScriptScansStagedFiles) {
    std::string script = HookInstaller::render_script("/opt/secret-guard");
    EXPECT_THAT(script, ::testing::StartsWith("#!/bin/sh\n"));
    EXPECT_THAT(script, ::testing::HasSubstr("git diff --cached --name-only --diff-filter=ACM -z | xargs -0 -r '/opt/secret-guard' --\n"));
    EXPECT_THAT(script, ::testing::HasSubstr("exec < /dev/tty"));
    EXPECT_THAT(script, ::testing::HasSubstr("Commit anyway? [y/N] "));
    EXPECT_THAT(script, ::testing::HasSubstr("y|Y|yes|YES) exit 0"));
    EXPECT_THAT(script, ::testing::HasSubstr("Commit aborted."));
}

TEST_F(HookInstallerTest, ShellQuote) {
    EXPECT_EQ(HookInstaller::shell_quote("/usr/bin/secret-guard"), "'/usr/bin/secret-guard'");
    EXPECT_EQ(HookInstaller::shell_quote("/home/o'neil/bin/sg"), "'/home/o'\\''neil/bin/sg'");
    EXPECT_EQ(HookInstaller::shell_quote("a b$c"), "'a b$c'");
}

} // namespace secret_guard
