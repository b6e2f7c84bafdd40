// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// - префиксы [+] [!] [x] [*] [~]
// - --quiet / -v / -vv
// - --output: stdout в файл, без ANSI
// - ColorMode
//
// ==============================================================================

#include <sdiff/output.hpp>
#include <sdiff/platform.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace sdiff::output::test {

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/// Захватить stderr на время вызова fn
template <typename Fn>
std::string capture_stderr(Writer& writer, Fn fn) {
    ::testing::internal::CaptureStderr();
    fn();
    writer.flush();
    return ::testing::internal::GetCapturedStderr();
}

OutputConfig plain_config() {
    OutputConfig config;
    config.color = ColorMode::Never;
    return config;
}

}  // namespace

// ==============================================================================
// Форматирование сообщений
// ==============================================================================

TEST(OutputTest, FormatHelpers_Prefixes) {
    EXPECT_EQ(format_info("ok"), "[+] ok\n");
    EXPECT_EQ(format_warning("careful"), "[!] careful\n");
    EXPECT_EQ(format_error("boom"), "[x] boom\n");
    EXPECT_EQ(format_debug("detail"), "[*] detail\n");
}

TEST(OutputTest, Colorize_DefaultUnchanged) {
    EXPECT_EQ(colorize("text", Color::Default), "text");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
}

TEST(OutputTest, Colorize_WrapsWithReset) {
    std::string s = colorize("text", Color::Red);
    EXPECT_EQ(s, ansi_color_code(Color::Red) + "text" + ansi_reset_code());
    EXPECT_EQ(ansi_color_code(Color::Green), "\x1b[32m");
    EXPECT_EQ(ansi_reset_code(), "\x1b[0m");
}

TEST(OutputTest, ColorMode_FromString) {
    EXPECT_EQ(color_mode_from_string("auto"), ColorMode::Auto);
    EXPECT_EQ(color_mode_from_string("ALWAYS"), ColorMode::Always);
    EXPECT_EQ(color_mode_from_string("never"), ColorMode::Never);
    EXPECT_FALSE(color_mode_from_string("sometimes").has_value());
}

// ==============================================================================
// Уровни сообщений
// ==============================================================================

TEST(OutputTest, Writer_Default_InfoAndWarnPrinted) {
    Writer writer(plain_config());
    std::string err = capture_stderr(writer, [&] {
        writer.info("loaded");
        writer.warn("odd");
    });
    EXPECT_EQ(err, "[+] loaded\n[!] odd\n");
}

TEST(OutputTest, Writer_QuietMode_InfoAndWarnSuppressed) {
    OutputConfig config = plain_config();
    config.quiet = true;
    Writer writer(config);
    std::string err = capture_stderr(writer, [&] {
        writer.info("hidden");
        writer.warn("hidden");
    });
    EXPECT_TRUE(err.empty());
}

TEST(OutputTest, Writer_QuietMode_ErrorStillPrinted) {
    OutputConfig config = plain_config();
    config.quiet = true;
    Writer writer(config);
    std::string err = capture_stderr(writer, [&] { writer.error("failed"); });
    EXPECT_EQ(err, "[x] failed\n");
}

TEST(OutputTest, Writer_DebugNeedsVerbose) {
    Writer silent(plain_config());
    EXPECT_TRUE(capture_stderr(silent, [&] { silent.debug("d"); }).empty());

    OutputConfig config = plain_config();
    config.verbose = 1;
    Writer verbose(config);
    std::string err = capture_stderr(verbose, [&] {
        verbose.debug("d");
        verbose.trace("t");
    });
    EXPECT_EQ(err, "[*] d\n");
}

TEST(OutputTest, Writer_TraceNeedsVerbose2) {
    OutputConfig config = plain_config();
    config.verbose = 2;
    Writer writer(config);
    std::string err = capture_stderr(writer, [&] {
        writer.debug("d");
        writer.trace("t");
    });
    EXPECT_EQ(err, "[*] d\n[~] t\n");
}

TEST(OutputTest, Writer_ColoredPrefixWhenAlways) {
    OutputConfig config;
    config.color = ColorMode::Always;
    Writer writer(config);
    std::string err = capture_stderr(writer, [&] { writer.error("boom"); });
    EXPECT_EQ(err, colorize("[x] ", Color::Red) + "boom\n");
}

// ==============================================================================
// use_color
// ==============================================================================

TEST(OutputTest, UseColor_Modes) {
    OutputConfig never;
    never.color = ColorMode::Never;
    EXPECT_FALSE(Writer(never).use_color(Stream::Stdout));
    EXPECT_FALSE(Writer(never).use_color(Stream::Stderr));

    OutputConfig always;
    always.color = ColorMode::Always;
    EXPECT_TRUE(Writer(always).use_color(Stream::Stdout));
    EXPECT_TRUE(Writer(always).use_color(Stream::Stderr));
}

// ==============================================================================
// --output
// ==============================================================================

TEST(OutputTest, Writer_OutputFile_StdoutRedirected) {
    auto path = platform::make_temp_file("sdiff_output_test_");

    {
        OutputConfig config;
        config.color = ColorMode::Always;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());

        // В файл цвет не идёт даже при --color always
        EXPECT_FALSE(writer.use_color(Stream::Stdout));

        writer.write(Stream::Stdout, "first ");
        writer.write_line(Stream::Stdout, "line");
        writer.write_line(Stream::Stdout, "second");
    }

    EXPECT_EQ(read_file(path), "first line\nsecond\n");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(OutputTest, Writer_OutputFile_BadPath) {
    OutputConfig config;
    config.output_path = std::filesystem::path("/nonexistent-dir-sdiff/sub/out.txt");
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

}  // namespace sdiff::output::test
