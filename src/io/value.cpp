// ==============================================================================
// value.cpp - Реализация Value (дерево значений документа)
// ==============================================================================
//
// - глубокое копирование
// - semantic_equals / preview / approximate_size
// - конверсии RapidJSON и yaml-cpp
//
// ==============================================================================

#include <sdiff/value.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <regex>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sdiff {

// ----------------------------------------------------------------------------
// Копирование и перемещение
// ----------------------------------------------------------------------------

Value::Value(const Value& other) : data_(Null{}) {
    *this = other;
}

Value& Value::operator=(const Value& other) {
    if (this == &other) {
        return *this;
    }
    switch (other.kind()) {
    case ValueKind::Null:
        data_ = Null{};
        break;
    case ValueKind::Bool:
        data_ = other.as_bool();
        break;
    case ValueKind::Number:
        data_ = other.as_number();
        break;
    case ValueKind::String:
        data_ = other.as_string();
        break;
    case ValueKind::Array:
        data_ = std::make_unique<Array>(other.as_array());
        break;
    case ValueKind::Object:
        data_ = std::make_unique<Object>(other.as_object());
        break;
    }
    return *this;
}

Value::Value(Value&& other) noexcept : data_(std::move(other.data_)) {
    other.data_ = Null{};
}

Value& Value::operator=(Value&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        other.data_ = Null{};
    }
    return *this;
}

// ----------------------------------------------------------------------------
// Тип
// ----------------------------------------------------------------------------

ValueKind Value::kind() const {
    if (is_null())
        return ValueKind::Null;
    if (is_bool())
        return ValueKind::Bool;
    if (is_number())
        return ValueKind::Number;
    if (is_string())
        return ValueKind::String;
    if (is_array())
        return ValueKind::Array;
    return ValueKind::Object;
}

const char* Value::type_name() const {
    switch (kind()) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Bool:
        return "boolean";
    case ValueKind::Number:
        return "number";
    case ValueKind::String:
        return "string";
    case ValueKind::Object:
        return "object";
    case ValueKind::Array:
        return "array";
    }
    return "null";
}

// ----------------------------------------------------------------------------
// semantic_equals
// ----------------------------------------------------------------------------

bool Value::semantic_equals(const Value& other) const {
    if (kind() != other.kind()) {
        return false;
    }

    switch (kind()) {
    case ValueKind::Null:
        return true;
    case ValueKind::Bool:
        return as_bool() == other.as_bool();
    case ValueKind::Number:
        return std::fabs(as_number() - other.as_number()) < NUMBER_EPSILON;
    case ValueKind::String:
        return as_string() == other.as_string();
    case ValueKind::Object: {
        const auto& a = as_object();
        const auto& b = other.as_object();
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& [key, value] : a) {
            auto it = b.find(key);
            if (it == b.end() || !value.semantic_equals(it->second)) {
                return false;
            }
        }
        return true;
    }
    case ValueKind::Array: {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!a[i].semantic_equals(b[i])) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

// ----------------------------------------------------------------------------
// preview
// ----------------------------------------------------------------------------

namespace {

std::string format_number(double n) {
    if (std::isnan(n)) {
        return "NaN";
    }
    if (std::isinf(n)) {
        return n > 0 ? "inf" : "-inf";
    }
    // Целые без дробной части печатаются без ".0"
    if (std::trunc(n) == n && std::fabs(n) < 9.2e18) {
        return std::to_string(static_cast<std::int64_t>(n));
    }
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), n);
    return std::string(buf, res.ptr);
}

std::string count_label(std::size_t count, const char* singular, const char* plural) {
    return std::to_string(count) + " " + (count == 1 ? singular : plural);
}

}  // anonymous namespace

std::string Value::preview(std::size_t max_len) const {
    std::string text;
    switch (kind()) {
    case ValueKind::Null:
        text = "null";
        break;
    case ValueKind::Bool:
        text = as_bool() ? "true" : "false";
        break;
    case ValueKind::Number:
        text = format_number(as_number());
        break;
    case ValueKind::String:
        text = "\"" + as_string() + "\"";
        break;
    case ValueKind::Object: {
        std::size_t count = as_object().size();
        text = count == 0 ? "{}" : "{ " + count_label(count, "key", "keys") + " }";
        break;
    }
    case ValueKind::Array: {
        std::size_t count = as_array().size();
        text = count == 0 ? "[]" : "[ " + count_label(count, "item", "items") + " ]";
        break;
    }
    }

    if (text.size() > max_len) {
        std::size_t keep = max_len >= 3 ? max_len - 3 : 0;
        // Не резать UTF-8 последовательность: отступить с байтов 10xxxxxx
        while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xC0) == 0x80) {
            --keep;
        }
        text.resize(keep);
        text += "...";
    }
    return text;
}

// ----------------------------------------------------------------------------
// approximate_size
// ----------------------------------------------------------------------------

std::size_t Value::approximate_size() const {
    std::size_t size = sizeof(Value);
    switch (kind()) {
    case ValueKind::String:
        size += as_string().size();
        break;
    case ValueKind::Object:
        size += sizeof(Object);
        for (const auto& [key, value] : as_object()) {
            size += key.size() + value.approximate_size();
        }
        break;
    case ValueKind::Array:
        size += sizeof(Array);
        for (const auto& item : as_array()) {
            size += item.approximate_size();
        }
        break;
    default:
        break;
    }
    return size;
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        // Все числовые формы (uint64/int64/double) сводятся к double
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

namespace {

void build_json(const Value& value, rapidjson::Value& out,
                rapidjson::Document::AllocatorType& alloc, bool strict) {
    switch (value.kind()) {
    case ValueKind::Null:
        out.SetNull();
        return;
    case ValueKind::Bool:
        out.SetBool(value.as_bool());
        return;
    case ValueKind::Number: {
        double d = value.as_number();
        if (!std::isfinite(d)) {
            if (strict) {
                throw std::runtime_error("could not convert number to JSON: non-finite value");
            }
            out.SetNull();
            return;
        }
        out.SetDouble(d);
        return;
    }
    case ValueKind::String: {
        const auto& s = value.as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }
    case ValueKind::Array: {
        out.SetArray();
        const auto& arr = value.as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            build_json(elem, v, alloc, strict);
            out.PushBack(v, alloc);
        }
        return;
    }
    case ValueKind::Object: {
        out.SetObject();
        for (const auto& [key, val] : value.as_object()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            build_json(val, v, alloc, strict);
            out.AddMember(k, v, alloc);
        }
        return;
    }
    }
    out.SetNull();
}

}  // anonymous namespace

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc,
                         bool null_non_finite) const {
    build_json(*this, out, alloc, !null_non_finite);
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

std::string Value::to_json_string() const {
    rapidjson::Document doc;
    build_json(*this, doc, doc.GetAllocator(), false);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ----------------------------------------------------------------------------
// Value::from_yaml
// ----------------------------------------------------------------------------
//
// Скаляры разрешаются по core schema YAML 1.2: yes/no/on/off остаются строками.
// Скаляры в кавычках (тег "!") всегда строки.
//

namespace {

constexpr const char* TAG_STR = "tag:yaml.org,2002:str";
constexpr const char* TAG_NULL = "tag:yaml.org,2002:null";
constexpr const char* TAG_BOOL = "tag:yaml.org,2002:bool";
constexpr const char* TAG_INT = "tag:yaml.org,2002:int";
constexpr const char* TAG_FLOAT = "tag:yaml.org,2002:float";

bool is_yaml_null(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool parse_yaml_bool(const std::string& s, bool& out) {
    if (s == "true" || s == "True" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "false" || s == "False" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

bool parse_yaml_number(const std::string& s, double& out) {
    static const std::regex int_dec(R"([-+]?[0-9]+)");
    static const std::regex int_oct(R"(0o[0-7]+)");
    static const std::regex int_hex(R"(0x[0-9a-fA-F]+)");
    static const std::regex float_num(R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)");
    static const std::regex float_inf(R"([-+]?\.(inf|Inf|INF))");
    static const std::regex float_nan(R"(\.(nan|NaN|NAN))");

    if (std::regex_match(s, int_oct)) {
        out = static_cast<double>(std::strtoull(s.c_str() + 2, nullptr, 8));
        return true;
    }
    if (std::regex_match(s, int_hex)) {
        out = static_cast<double>(std::strtoull(s.c_str() + 2, nullptr, 16));
        return true;
    }
    if (std::regex_match(s, int_dec) || std::regex_match(s, float_num)) {
        out = std::strtod(s.c_str(), nullptr);
        return true;
    }
    if (std::regex_match(s, float_inf)) {
        double inf = std::numeric_limits<double>::infinity();
        out = s[0] == '-' ? -inf : inf;
        return true;
    }
    if (std::regex_match(s, float_nan)) {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    return false;
}

Value yaml_scalar_to_value(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    const std::string& tag = node.Tag();

    // Скаляр в кавычках или с явным !!str
    if (tag == "!" || tag == TAG_STR) {
        return Value(text);
    }

    bool b = false;
    double d = 0.0;

    if (tag == TAG_NULL) {
        return Value();
    }
    if (tag == TAG_BOOL) {
        return parse_yaml_bool(text, b) ? Value(b) : Value(text);
    }
    if (tag == TAG_INT || tag == TAG_FLOAT) {
        return parse_yaml_number(text, d) ? Value(d) : Value(text);
    }

    // Простой скаляр без тега ("?") или пользовательский тег: значение тега игнорируется
    if (is_yaml_null(text) && tag == "?") {
        return Value();
    }
    if (parse_yaml_bool(text, b)) {
        return Value(b);
    }
    if (parse_yaml_number(text, d)) {
        return Value(d);
    }
    return Value(text);
}

std::string yaml_key_to_string(const YAML::Node& key) {
    if (key.IsNull()) {
        return "null";
    }
    if (key.IsScalar()) {
        return key.Scalar();
    }
    // Составной ключ: flow-представление
    YAML::Emitter emitter;
    emitter << YAML::Flow << key;
    return std::string(emitter.c_str());
}

}  // anonymous namespace

Value Value::from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value();

    case YAML::NodeType::Scalar:
        return yaml_scalar_to_value(node);

    case YAML::NodeType::Sequence: {
        Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(from_yaml(item));
        }
        return Value(std::move(arr));
    }

    case YAML::NodeType::Map: {
        Object obj;
        for (const auto& kv : node) {
            obj[yaml_key_to_string(kv.first)] = from_yaml(kv.second);
        }
        return Value(std::move(obj));
    }
    }

    return Value();
}

}  // namespace sdiff
