// ==============================================================================
// parser.cpp - Загрузка документов JSON / YAML
// ==============================================================================
//
// JSON: RapidJSON, весь текст в памяти.
// YAML: yaml-cpp, YAML::Exception ловится здесь и превращается в ParseResult.
//
// ==============================================================================

#include <sdiff/parser.hpp>
#include <sdiff/platform.hpp>

#include <cctype>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace sdiff::io {

// ============================================================================
// DocumentKind
// ============================================================================

const char* document_kind_to_string(DocumentKind kind) {
    switch (kind) {
    case DocumentKind::Json:
        return "json";
    case DocumentKind::Yaml:
        return "yaml";
    case DocumentKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

DocumentKind document_kind_from_extension(std::string_view ext) {
    std::string lower_ext;
    lower_ext.reserve(ext.size());
    for (char c : ext) {
        lower_ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower_ext == "json") {
        return DocumentKind::Json;
    }
    if (lower_ext == "yaml" || lower_ext == "yml") {
        return DocumentKind::Yaml;
    }
    return DocumentKind::Unknown;
}

DocumentKind document_kind_from_path(const std::filesystem::path& path) {
    if (path.has_extension()) {
        std::string ext = platform::path_to_utf8(path.extension());
        if (!ext.empty() && ext[0] == '.') {
            ext = ext.substr(1);
        }
        return document_kind_from_extension(ext);
    }
    return DocumentKind::Unknown;
}

bool is_null_file(std::string_view path) {
    return path == "/dev/null" || path == "nul" || path == "NUL";
}

// ============================================================================
// ParseError
// ============================================================================

std::string ParseError::format() const {
    if (path.empty()) {
        return "[!] " + message + "\n";
    }
    return "[!] failed to load file '" + path + "' - " + message + "\n";
}

// ============================================================================
// Парсеры
// ============================================================================

ParseResult parse_json(std::string_view text) {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(text.data(), text.size());

    if (doc.HasParseError()) {
        return ParseResult::failure(ParseErrorKind::JsonError,
                                    std::string("JSON parse error: ") +
                                        rapidjson::GetParseError_En(doc.GetParseError()) +
                                        " at offset " + std::to_string(doc.GetErrorOffset()));
    }

    return ParseResult::success(Value::from_rapidjson(doc));
}

ParseResult parse_yaml(std::string_view text) {
    try {
        YAML::Node root = YAML::Load(std::string(text));
        return ParseResult::success(Value::from_yaml(root));
    } catch (const YAML::Exception& e) {
        return ParseResult::failure(ParseErrorKind::YamlError,
                                    std::string("YAML parse error: ") + e.what());
    }
}

ParseResult parse_content(std::string_view text, DocumentKind kind) {
    switch (kind) {
    case DocumentKind::Json:
        return parse_json(text);
    case DocumentKind::Yaml:
        return parse_yaml(text);
    case DocumentKind::Unknown:
        break;
    }

    // Неизвестное расширение: сначала JSON, затем YAML
    ParseResult json = parse_json(text);
    if (json.ok) {
        return json;
    }
    ParseResult yaml = parse_yaml(text);
    if (yaml.ok) {
        return yaml;
    }
    return ParseResult::failure(ParseErrorKind::UnknownFormat,
                                "unable to detect format (tried JSON and YAML)");
}

ParseResult parse_file(const std::filesystem::path& path) {
    std::string path_str = platform::path_to_utf8(path);

    // git передаёт /dev/null для созданных и удалённых файлов
    if (is_null_file(path_str)) {
        return ParseResult::success(Value::make_object());
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ParseResult::failure(ParseErrorKind::FileNotFound, "file not found", path_str);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ParseResult::failure(ParseErrorKind::ReadError, "could not open file", path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ParseResult::failure(ParseErrorKind::ReadError, "could not read file", path_str);
    }

    ParseResult result = parse_content(buffer.str(), document_kind_from_path(path));
    if (!result.ok) {
        result.error.path = path_str;
    }
    return result;
}

ParseResult parse_stream(std::istream& in, DocumentKind kind) {
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return ParseResult::failure(ParseErrorKind::ReadError, "could not read stream", "-");
    }

    ParseResult result = parse_content(buffer.str(), kind);
    if (!result.ok) {
        result.error.path = "-";
    }
    return result;
}

}  // namespace sdiff::io
