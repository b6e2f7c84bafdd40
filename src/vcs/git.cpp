// ==============================================================================
// git.cpp - Интеграция с git
// ==============================================================================

#include <sdiff/git.hpp>

#include <cctype>

namespace sdiff::vcs {

namespace {

// Код выхода shell'а для ненайденной команды
constexpr int EXIT_COMMAND_NOT_FOUND = 127;

// git config --unset: ключ не задан
constexpr int EXIT_KEY_NOT_SET = 5;

GitResult success(std::string output) {
    GitResult r;
    r.ok = true;
    r.output = std::move(output);
    return r;
}

GitResult failure(GitErrorKind kind, std::string message = {}) {
    GitResult r;
    r.ok = false;
    r.error = GitError{kind, std::move(message)};
    return r;
}

std::string trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(begin, end - begin));
}

/// Запустить git; ошибки запуска -> GitResult с ошибкой
std::optional<GitResult> launch_failure(const platform::CommandOutput& out) {
    if (!out.started) {
        return failure(GitErrorKind::CommandFailed, "could not start git process");
    }
    if (out.exit_code == EXIT_COMMAND_NOT_FOUND) {
        return failure(GitErrorKind::GitNotFound);
    }
    return std::nullopt;
}

GitResult git_config_set(const CommandRunner& run, const std::string& key,
                         const std::string& value) {
    auto out = run({"git", "config", "--global", key, value});
    if (auto err = launch_failure(out)) {
        return *err;
    }
    if (out.exit_code != 0) {
        return failure(GitErrorKind::GitError, trim(out.stderr_text));
    }
    return success({});
}

GitResult git_config_unset(const CommandRunner& run, const std::string& key) {
    auto out = run({"git", "config", "--global", "--unset", key});
    if (auto err = launch_failure(out)) {
        return *err;
    }
    if (out.exit_code != 0 && out.exit_code != EXIT_KEY_NOT_SET) {
        return failure(GitErrorKind::GitError, trim(out.stderr_text));
    }
    return success({});
}

/// Значение ключа; nullopt если не задан
std::optional<std::string> git_config_get(const CommandRunner& run, const std::string& key,
                                          std::optional<GitResult>& error) {
    auto out = run({"git", "config", "--global", "--get", key});
    if (auto err = launch_failure(out)) {
        error = std::move(err);
        return std::nullopt;
    }
    if (out.exit_code != 0) {
        return std::nullopt;
    }
    return trim(out.stdout_text);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// GitError
// ----------------------------------------------------------------------------

std::string GitError::format() const {
    switch (kind) {
    case GitErrorKind::CommandFailed:
        return "Failed to execute git command: " + message;
    case GitErrorKind::GitNotFound:
        return "Git is not installed or not in PATH";
    case GitErrorKind::ExecutableNotFound:
        return "Failed to determine sdiff executable path";
    case GitErrorKind::GitError:
        return "Git command returned error: " + message;
    }
    return message;
}

// ----------------------------------------------------------------------------
// install / uninstall / status
// ----------------------------------------------------------------------------

GitResult install(const std::string& exe, const CommandRunner& run) {
    if (exe.empty()) {
        return failure(GitErrorKind::ExecutableNotFound);
    }

    const std::pair<const char*, std::string> entries[] = {
        {KEY_DIFFTOOL_CMD, exe + " \"$LOCAL\" \"$REMOTE\""},
        {KEY_DIFF_COMMAND, exe},
        {KEY_DIFFTOOL_PROMPT, "false"},
    };
    for (const auto& [key, value] : entries) {
        GitResult r = git_config_set(run, key, value);
        if (!r.ok) {
            return r;
        }
    }

    std::string text;
    text += "Successfully installed sdiff as git difftool.\n";
    text += "\n";
    text += "Usage:\n";
    text += "  git difftool -t sdiff HEAD~1 -- file.json\n";
    text += "  git difftool -t sdiff branch1 branch2 -- config.yaml\n";
    text += "\n";
    text += "To use automatically for specific files, add to .gitattributes:\n";
    text += "  *.json diff=sdiff\n";
    text += "  *.yaml diff=sdiff\n";
    text += "  *.yml diff=sdiff\n";
    return success(std::move(text));
}

GitResult uninstall(const CommandRunner& run) {
    for (const char* key : {KEY_DIFFTOOL_CMD, KEY_DIFFTOOL_PROMPT, KEY_DIFF_COMMAND}) {
        GitResult r = git_config_unset(run, key);
        if (!r.ok) {
            return r;
        }
    }
    return success("Successfully uninstalled sdiff from git configuration.\n");
}

GitResult status(const CommandRunner& run) {
    std::string text = "Git sdiff configuration status:\n\n";
    bool has_tool = false;
    bool has_driver = false;

    for (const char* key : {KEY_DIFFTOOL_CMD, KEY_DIFFTOOL_PROMPT, KEY_DIFF_COMMAND}) {
        std::optional<GitResult> error;
        std::optional<std::string> value = git_config_get(run, key, error);
        if (error) {
            return *error;
        }

        text += "  ";
        text += key;
        text += ": ";
        text += value ? *value : "(not configured)";
        text += "\n";

        if (value && std::string_view(key) == KEY_DIFFTOOL_CMD) {
            has_tool = true;
        }
        if (value && std::string_view(key) == KEY_DIFF_COMMAND) {
            has_driver = true;
        }
    }

    text += "\n";
    if (has_tool || has_driver) {
        text += "sdiff is configured as a git difftool.\n";
        text += "\n";
        text += "Usage:\n";
        text += "  git difftool -t sdiff HEAD~1 -- file.json\n";
    } else {
        text += "sdiff is not configured. Run 'sdiff --git-install' to set up.\n";
    }
    return success(std::move(text));
}

// ----------------------------------------------------------------------------
// Протокол diff driver'а
// ----------------------------------------------------------------------------

bool is_git_hash(std::string_view s) {
    if (s.size() != 40) {
        return false;
    }
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<std::pair<std::string, std::string>> detect_git_diff_driver_args(
    const std::vector<std::string>& args) {
    if (args.size() != 7) {
        return std::nullopt;
    }
    if (!is_git_hash(args[2]) || !is_git_hash(args[5])) {
        return std::nullopt;
    }
    return std::make_pair(args[1], args[4]);
}

}  // namespace sdiff::vcs
