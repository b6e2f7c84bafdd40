// ==============================================================================
// test_git_gtest.cpp - Тесты интеграции с git
// ==============================================================================
//
// git не запускается: CommandRunner подменяется записывающей заглушкой.
//
// ==============================================================================

#include <sdiff/git.hpp>

#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace sdiff::vcs::test {

namespace {

/// Поддельный git: хранит глобальный config в map
class FakeGit {
public:
    std::map<std::string, std::string> config;
    std::vector<std::vector<std::string>> calls;
    int forced_exit = -1;  // >= 0: любой вызов завершается с этим кодом
    std::string forced_stderr;

    CommandRunner runner() {
        return [this](const std::vector<std::string>& argv) { return handle(argv); };
    }

private:
    platform::CommandOutput handle(const std::vector<std::string>& argv) {
        calls.push_back(argv);

        platform::CommandOutput out;
        out.started = true;
        if (forced_exit >= 0) {
            out.exit_code = forced_exit;
            out.stderr_text = forced_stderr;
            return out;
        }

        // git config --global [--unset|--get] key [value]
        if (argv.size() == 5 && argv[3] == "--get") {
            auto it = config.find(argv[4]);
            if (it == config.end()) {
                out.exit_code = 1;
            } else {
                out.exit_code = 0;
                out.stdout_text = it->second + "\n";
            }
        } else if (argv.size() == 5 && argv[3] == "--unset") {
            out.exit_code = config.erase(argv[4]) > 0 ? 0 : 5;
        } else if (argv.size() == 5) {
            config[argv[3]] = argv[4];
            out.exit_code = 0;
        } else {
            out.exit_code = 129;
        }
        return out;
    }
};

}  // namespace

// ============================================================================
// install
// ============================================================================

TEST(GitTest, Install_SetsAllKeys) {
    FakeGit git;
    auto r = install("/usr/local/bin/sdiff", git.runner());
    ASSERT_TRUE(r.ok) << r.error.format();

    EXPECT_EQ(git.config[KEY_DIFFTOOL_CMD], "/usr/local/bin/sdiff \"$LOCAL\" \"$REMOTE\"");
    EXPECT_EQ(git.config[KEY_DIFF_COMMAND], "/usr/local/bin/sdiff");
    EXPECT_EQ(git.config[KEY_DIFFTOOL_PROMPT], "false");
    EXPECT_EQ(r.output.rfind("Successfully installed sdiff as git difftool.\n", 0), 0u);
    EXPECT_NE(r.output.find("*.yaml diff=sdiff"), std::string::npos);

    ASSERT_EQ(git.calls.size(), 3u);
    EXPECT_EQ(git.calls[0],
              (std::vector<std::string>{"git", "config", "--global", KEY_DIFFTOOL_CMD,
                                        "/usr/local/bin/sdiff \"$LOCAL\" \"$REMOTE\""}));
}

TEST(GitTest, Install_EmptyExecutable) {
    FakeGit git;
    auto r = install("", git.runner());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, GitErrorKind::ExecutableNotFound);
    EXPECT_TRUE(git.calls.empty());
}

TEST(GitTest, Install_GitMissing) {
    FakeGit git;
    git.forced_exit = 127;
    auto r = install("/bin/sdiff", git.runner());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, GitErrorKind::GitNotFound);
    EXPECT_EQ(r.error.format(), "Git is not installed or not in PATH");
    EXPECT_EQ(git.calls.size(), 1u);
}

TEST(GitTest, Install_GitErrorCarriesStderr) {
    FakeGit git;
    git.forced_exit = 3;
    git.forced_stderr = "error: could not lock config file\n";
    auto r = install("/bin/sdiff", git.runner());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, GitErrorKind::GitError);
    EXPECT_EQ(r.error.message, "error: could not lock config file");
    EXPECT_EQ(r.error.format(),
              "Git command returned error: error: could not lock config file");
}

TEST(GitTest, Install_ProcessNotStarted) {
    CommandRunner broken = [](const std::vector<std::string>&) {
        return platform::CommandOutput{};
    };
    auto r = install("/bin/sdiff", broken);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, GitErrorKind::CommandFailed);
}

// ============================================================================
// uninstall
// ============================================================================

TEST(GitTest, Uninstall_RemovesKeys) {
    FakeGit git;
    ASSERT_TRUE(install("/bin/sdiff", git.runner()).ok);

    auto r = uninstall(git.runner());
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(git.config.empty());
    EXPECT_EQ(r.output, "Successfully uninstalled sdiff from git configuration.\n");
}

TEST(GitTest, Uninstall_MissingKeysNotAnError) {
    FakeGit git;
    auto r = uninstall(git.runner());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(git.calls.size(), 3u);
}

// ============================================================================
// status
// ============================================================================

TEST(GitTest, Status_NotConfigured) {
    FakeGit git;
    auto r = status(git.runner());
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.output.rfind("Git sdiff configuration status:\n\n", 0), 0u);
    EXPECT_NE(r.output.find("  difftool.sdiff.cmd: (not configured)\n"), std::string::npos);
    EXPECT_NE(r.output.find("sdiff is not configured. Run 'sdiff --git-install' to set up."),
              std::string::npos);
}

TEST(GitTest, Status_Configured) {
    FakeGit git;
    ASSERT_TRUE(install("/opt/sdiff", git.runner()).ok);

    auto r = status(git.runner());
    ASSERT_TRUE(r.ok);
    EXPECT_NE(r.output.find("  diff.sdiff.command: /opt/sdiff\n"), std::string::npos);
    EXPECT_NE(r.output.find("  difftool.sdiff.prompt: false\n"), std::string::npos);
    EXPECT_NE(r.output.find("sdiff is configured as a git difftool."), std::string::npos);
}

TEST(GitTest, Status_GitMissing) {
    FakeGit git;
    git.forced_exit = 127;
    auto r = status(git.runner());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error.kind, GitErrorKind::GitNotFound);
}

// ============================================================================
// Протокол diff driver'а
// ============================================================================

TEST(GitTest, IsGitHash) {
    EXPECT_TRUE(is_git_hash(std::string(40, '0')));
    EXPECT_TRUE(is_git_hash("0123456789abcdefABCDEF0123456789abcdef01"));
    EXPECT_FALSE(is_git_hash(std::string(39, 'a')));
    EXPECT_FALSE(is_git_hash(std::string(41, 'a')));
    EXPECT_FALSE(is_git_hash(std::string(39, 'a') + "g"));
    EXPECT_FALSE(is_git_hash(""));
}

TEST(GitTest, DetectDriverArgs) {
    const std::string h1(40, 'a');
    const std::string h2(40, 'b');

    auto files = detect_git_diff_driver_args(
        {"app.yaml", "/tmp/XyZ_app.yaml", h1, "100644", "app.yaml", h2, "100644"});
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files->first, "/tmp/XyZ_app.yaml");
    EXPECT_EQ(files->second, "app.yaml");
}

TEST(GitTest, DetectDriverArgs_Rejects) {
    const std::string h(40, 'a');
    EXPECT_FALSE(detect_git_diff_driver_args({"a", "b"}).has_value());
    EXPECT_FALSE(
        detect_git_diff_driver_args({"p", "old", "nothash", "100644", "new", h, "100644"})
            .has_value());
    EXPECT_FALSE(detect_git_diff_driver_args({"p", "old", h, "100644", "new", h, "100644", "x"})
                     .has_value());
}

}  // namespace sdiff::vcs::test
