// ==============================================================================
// sdiff/parser.hpp - Загрузка документов JSON / YAML
// ==============================================================================
//
// Назначение:
// - DocumentKind: тип документа по расширению
// - parse_json / parse_yaml / parse_content: текст -> Value
// - parse_file / parse_stream: файл или поток -> Value
//
// Ошибки не бросаются наружу: результат - ParseResult с ParseError.
// Числа всегда double; потеря точности больших целых допустима.
//
// ==============================================================================

#ifndef SDIFF_PARSER_HPP
#define SDIFF_PARSER_HPP

#include <sdiff/value.hpp>

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace sdiff::io {

// ----------------------------------------------------------------------------
// DocumentKind - типы документов
// ----------------------------------------------------------------------------

enum class DocumentKind {
    Json,    // .json
    Yaml,    // .yaml, .yml
    Unknown  // Пробуем JSON, затем YAML
};

/// "json" / "yaml" / "unknown"
const char* document_kind_to_string(DocumentKind kind);

/// Определить DocumentKind по расширению (без точки, регистр не важен)
DocumentKind document_kind_from_extension(std::string_view ext);

/// Определить DocumentKind по пути файла
DocumentKind document_kind_from_path(const std::filesystem::path& path);

/// Пустой файл, который git передаёт для созданных/удалённых файлов:
/// "/dev/null", "nul", "NUL"
bool is_null_file(std::string_view path);

// ----------------------------------------------------------------------------
// ParseError / ParseResult
// ----------------------------------------------------------------------------

enum class ParseErrorKind {
    FileNotFound,  // Файла нет
    ReadError,     // Не удалось прочитать
    JsonError,     // Синтаксическая ошибка JSON
    YamlError,     // Синтаксическая ошибка YAML
    UnknownFormat  // Ни JSON, ни YAML
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::ReadError;
    std::string message;
    std::string path;  // пусто для parse_content

    /// "[!] failed to load file '<path>' - <message>\n"
    /// или "[!] <message>\n", если путь неизвестен
    std::string format() const;
};

struct ParseResult {
    bool ok = false;
    Value value;
    ParseError error;

    explicit operator bool() const { return ok; }

    static ParseResult success(Value v) {
        ParseResult r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static ParseResult failure(ParseErrorKind kind, std::string message, std::string path = {}) {
        ParseResult r;
        r.ok = false;
        r.error = ParseError{kind, std::move(message), std::move(path)};
        return r;
    }
};

// ----------------------------------------------------------------------------
// Парсеры
// ----------------------------------------------------------------------------

/// Распарсить JSON (RapidJSON, kParseFullPrecisionFlag)
ParseResult parse_json(std::string_view text);

/// Распарсить YAML (yaml-cpp, скаляры по core schema YAML 1.2).
/// Пустой документ даёт Null.
ParseResult parse_yaml(std::string_view text);

/// Распарсить текст указанного типа; Unknown - JSON, затем YAML
ParseResult parse_content(std::string_view text, DocumentKind kind);

/// Прочитать и распарсить файл; тип по расширению.
/// is_null_file пути дают пустой Object.
ParseResult parse_file(const std::filesystem::path& path);

/// Прочитать поток целиком (stdin для "-") и распарсить
ParseResult parse_stream(std::istream& in, DocumentKind kind = DocumentKind::Unknown);

}  // namespace sdiff::io

#endif  // SDIFF_PARSER_HPP
