// ==============================================================================
// test_platform_gtest.cpp - Тесты platform (GoogleTest)
// ==============================================================================
//
// - UTF-8 <-> path
// - временные файлы
// - путь исполняемого файла
// - внешние команды: shell_quote / run_command
//
// ==============================================================================

#include <sdiff/platform.hpp>

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sdiff::platform::test {

// ============================================================================
// Пути
// ============================================================================

TEST(PlatformTest, PathUtf8_RoundTrip) {
    const std::string original = u8"data/отчёт.yaml";
    auto path = path_from_utf8(original);
    EXPECT_EQ(path_to_utf8(path), original);
}

TEST(PlatformTest, PathUtf8_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_EQ(path_to_utf8(std::filesystem::path()), "");
}

// ============================================================================
// Временные файлы
// ============================================================================

TEST(PlatformTest, MakeTempFile_CreatesDistinctFiles) {
    auto a = make_temp_file("sdiff_platform_test");
    auto b = make_temp_file("sdiff_platform_test");

    EXPECT_TRUE(std::filesystem::exists(a));
    EXPECT_TRUE(std::filesystem::exists(b));
    EXPECT_NE(a, b);
    EXPECT_NE(path_to_utf8(a.filename()).find("sdiff_platform_test"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(a, ec);
    std::filesystem::remove(b, ec);
}

// ============================================================================
// Процесс
// ============================================================================

TEST(PlatformTest, CurrentExecutablePath_Exists) {
    auto exe = current_executable_path("unused");
    EXPECT_FALSE(exe.empty());
    EXPECT_TRUE(exe.is_absolute());
}

TEST(PlatformTest, OsName_Known) {
    std::string name = os_name();
#ifdef __linux__
    EXPECT_EQ(name, "Linux");
#else
    EXPECT_FALSE(name.empty());
#endif
}

// ============================================================================
// Внешние команды
// ============================================================================

#ifndef _WIN32

TEST(PlatformTest, ShellQuote_Posix) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("with space"), "'with space'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("$LOCAL"), "'$LOCAL'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(PlatformTest, RunCommand_CapturesStdout) {
    auto out = run_command({"echo", "hello world"});
    EXPECT_TRUE(out.started);
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_TRUE(out.success());
    EXPECT_EQ(out.stdout_text, "hello world\n");
}

TEST(PlatformTest, RunCommand_CapturesStderrAndExitCode) {
    auto out = run_command({"sh", "-c", "echo oops >&2; exit 3"});
    EXPECT_TRUE(out.started);
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_FALSE(out.success());
    EXPECT_EQ(out.stderr_text, "oops\n");
    EXPECT_TRUE(out.stdout_text.empty());
}

TEST(PlatformTest, RunCommand_ArgumentsNotExpanded) {
    auto out = run_command({"echo", "$HOME", "a;b"});
    EXPECT_EQ(out.stdout_text, "$HOME a;b\n");
}

TEST(PlatformTest, RunCommand_MissingCommandIs127) {
    auto out = run_command({"sdiff-definitely-missing-command-xyz"});
    EXPECT_TRUE(out.started);
    EXPECT_EQ(out.exit_code, 127);
}

#endif

TEST(PlatformTest, RunCommand_EmptyArgvNotStarted) {
    auto out = run_command({});
    EXPECT_FALSE(out.started);
    EXPECT_FALSE(out.success());
}

}  // namespace sdiff::platform::test
