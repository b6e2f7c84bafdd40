// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include <sdiff/platform.hpp>

#include <array>
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <cstdlib>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace sdiff::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix) {
#ifdef _WIN32
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex[dis(gen)];
    }

    std::filesystem::path full_path = std::filesystem::temp_directory_path() /
                                      path_from_utf8(std::string(prefix) + "_" + suffix + ".tmp");
    HANDLE h = CreateFileW(full_path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_TEMPORARY, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Failed to create temp file");
    }
    CloseHandle(h);
    return full_path;
#else
    std::string temp_dir = "/tmp";
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && tmpdir[0] != '\0') {
        temp_dir = tmpdir;
    }

    std::string tmpl = temp_dir + "/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    close(fd);

    return std::filesystem::path(tmpl_buf.data());
#endif
}

// ----------------------------------------------------------------------------
// Исполняемый файл
// ----------------------------------------------------------------------------

std::filesystem::path current_executable_path(std::string_view fallback) {
    std::error_code ec;
#ifdef _WIN32
    std::wstring buf(MAX_PATH, L'\0');
    DWORD len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (len > 0 && len < buf.size()) {
        buf.resize(len);
        return std::filesystem::path(buf);
    }
#else
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) {
        return exe;
    }
#endif
    auto abs = std::filesystem::absolute(path_from_utf8(fallback), ec);
    if (ec) {
        return path_from_utf8(fallback);
    }
    return abs;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

// ----------------------------------------------------------------------------
// Внешние команды
// ----------------------------------------------------------------------------

std::string shell_quote(std::string_view arg) {
#ifdef _WIN32
    std::string result = "\"";
    for (char c : arg) {
        if (c == '"') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
#else
    std::string result = "'";
    for (char c : arg) {
        if (c == '\'') {
            // ' -> '\''
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
#endif
}

namespace {

std::string read_whole_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return {};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // anonymous namespace

CommandOutput run_command(const std::vector<std::string>& argv) {
    CommandOutput out;
    if (argv.empty()) {
        return out;
    }

    // stderr уходит во временный файл, stdout читается из pipe
    std::filesystem::path err_path;
    try {
        err_path = make_temp_file("sdiff_stderr");
    } catch (const std::runtime_error&) {
        return out;
    }

    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) {
            cmd += ' ';
        }
        cmd += shell_quote(arg);
    }
    cmd += " 2>" + shell_quote(path_to_utf8(err_path));

#ifdef _WIN32
    FILE* pipe = _popen(cmd.c_str(), "r");
#else
    FILE* pipe = popen(cmd.c_str(), "r");
#endif
    if (pipe == nullptr) {
        std::error_code ec;
        std::filesystem::remove(err_path, ec);
        return out;
    }

    out.started = true;
    std::array<char, 4096> buf{};
    std::size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        out.stdout_text.append(buf.data(), n);
    }

#ifdef _WIN32
    out.exit_code = _pclose(pipe);
#else
    int status = pclose(pipe);
    if (status == -1) {
        out.exit_code = -1;
    } else if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else {
        out.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
#endif

    out.stderr_text = read_whole_file(err_path);
    std::error_code ec;
    std::filesystem::remove(err_path, ec);
    return out;
}

}  // namespace sdiff::platform
