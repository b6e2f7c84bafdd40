// ==============================================================================
// render.cpp - Представление Diff для вывода
// ==============================================================================

#include <sdiff/output.hpp>
#include <sdiff/render.hpp>

#include <cctype>
#include <cstdint>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <vector>

namespace sdiff::render {

namespace {

using output::Color;

constexpr const char* NO_CHANGES = "No changes detected.";
constexpr const char* MODIFIED_MARK = "\xe2\x80\xa2";  // • U+2022
constexpr const char* ARROW = "\xe2\x86\x92";          // → U+2192

bool should_show(const Change& change, const RenderOptions& options) {
    return !options.compact || change.type != ChangeType::Unchanged;
}

/// Текст в цвете, если раскраска включена
std::string paint(std::string_view text, Color color, bool enabled) {
    return enabled ? output::colorize(text, color) : std::string(text);
}

std::string format_change_line(const Change& change, const RenderOptions& options, bool color) {
    const std::string path = format_path(change.path);

    switch (change.type) {
    case ChangeType::Added: {
        std::string value = format_value(*change.new_value, options);
        return paint("+", Color::Green, color) + " " + paint(path, Color::Green, color) + ": " +
               paint(value, Color::Green, color);
    }
    case ChangeType::Removed: {
        std::string value = format_value(*change.old_value, options);
        return paint("-", Color::Red, color) + " " + paint(path, Color::Red, color) + ": " +
               paint(value, Color::Red, color);
    }
    case ChangeType::Modified: {
        std::string old_value = format_value(*change.old_value, options);
        std::string new_value = format_value(*change.new_value, options);
        return paint(MODIFIED_MARK, Color::Yellow, color) + " " +
               paint(path, Color::Yellow, color) + ": " + paint(old_value, Color::Yellow, color) +
               " " + paint(ARROW, Color::Yellow, color) + " " +
               paint(new_value, Color::Yellow, color);
    }
    case ChangeType::Unchanged: {
        const auto& v = change.old_value ? change.old_value : change.new_value;
        std::string value = v ? format_value(*v, options) : std::string("null");
        return "  " + paint(path, Color::Dim, color) + ": " + paint(value, Color::Dim, color);
    }
    }
    return {};
}

std::string format_text(const Diff& diff, const RenderOptions& options, bool color) {
    std::string result;
    bool any = false;

    for (const auto& change : diff.changes) {
        if (!should_show(change, options)) {
            continue;
        }
        any = true;
        result += format_change_line(change, options, color);
        result += '\n';
    }

    if (!any) {
        return paint(NO_CHANGES, Color::Dim, color);
    }

    result += '\n';
    result += format_summary(diff.stats);
    return result;
}

void set_optional_value(rapidjson::Value& obj, const char* name, const std::optional<Value>& v,
                        rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value json;
    if (v) {
        // NaN/Inf в JSON не представимы: null
        v->to_rapidjson(json, alloc, true);
    }
    obj.AddMember(rapidjson::StringRef(name), json, alloc);
}

RenderResult format_json(const Diff& diff) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    rapidjson::Value changes(rapidjson::kArrayType);
    for (const auto& change : diff.changes) {
        rapidjson::Value entry(rapidjson::kObjectType);

        rapidjson::Value path(rapidjson::kArrayType);
        for (const auto& seg : change.path) {
            std::string text = seg.to_string();
            rapidjson::Value s;
            s.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), alloc);
            path.PushBack(s, alloc);
        }
        entry.AddMember("path", path, alloc);

        rapidjson::Value type;
        type.SetString(rapidjson::StringRef(change_type_to_string(change.type)));
        entry.AddMember("type", type, alloc);

        set_optional_value(entry, "old_value", change.old_value, alloc);
        set_optional_value(entry, "new_value", change.new_value, alloc);

        changes.PushBack(entry, alloc);
    }
    doc.AddMember("changes", changes, alloc);

    rapidjson::Value stats(rapidjson::kObjectType);
    stats.AddMember("added", static_cast<std::uint64_t>(diff.stats.added), alloc);
    stats.AddMember("removed", static_cast<std::uint64_t>(diff.stats.removed), alloc);
    stats.AddMember("modified", static_cast<std::uint64_t>(diff.stats.modified), alloc);
    stats.AddMember("unchanged", static_cast<std::uint64_t>(diff.stats.unchanged), alloc);
    doc.AddMember("stats", stats, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    RenderResult r;
    if (!doc.Accept(writer)) {
        r.error = "JSON serialization failed: writer rejected document";
        return r;
    }
    r.ok = true;
    r.text.assign(buffer.GetString(), buffer.GetSize());
    return r;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// RenderFormat
// ----------------------------------------------------------------------------

const char* render_format_to_string(RenderFormat format) {
    switch (format) {
    case RenderFormat::Terminal:
        return "terminal";
    case RenderFormat::Plain:
        return "plain";
    case RenderFormat::Json:
        return "json";
    }
    return "terminal";
}

std::optional<RenderFormat> render_format_from_string(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "terminal") {
        return RenderFormat::Terminal;
    }
    if (lower == "plain") {
        return RenderFormat::Plain;
    }
    if (lower == "json") {
        return RenderFormat::Json;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

std::string format_path(const Path& path) {
    if (path.empty()) {
        return "(root)";
    }

    std::string result;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& seg = path[i];
        if (seg.is_index()) {
            result += seg.to_string();
        } else {
            if (i > 0) {
                result += '.';
            }
            result += seg.key_name();
        }
    }
    return result;
}

std::string format_value(const Value& value, const RenderOptions& options) {
    if (options.show_values) {
        return value.to_json_string();
    }
    return value.preview(options.max_value_length);
}

std::string format_summary(const DiffStats& stats) {
    if (stats.is_empty()) {
        return "Summary: No changes";
    }

    std::vector<std::string> parts;
    if (stats.added > 0) {
        parts.push_back(std::to_string(stats.added) + " added");
    }
    if (stats.removed > 0) {
        parts.push_back(std::to_string(stats.removed) + " removed");
    }
    if (stats.modified > 0) {
        parts.push_back(std::to_string(stats.modified) + " modified");
    }
    if (stats.unchanged > 0) {
        parts.push_back(std::to_string(stats.unchanged) + " unchanged");
    }

    std::string result = "Summary: ";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += parts[i];
    }
    return result;
}

RenderResult format_diff(const Diff& diff, RenderFormat format, const RenderOptions& options) {
    switch (format) {
    case RenderFormat::Json:
        return format_json(diff);
    case RenderFormat::Terminal:
        return RenderResult{true, format_text(diff, options, options.color), {}};
    case RenderFormat::Plain:
        break;
    }
    return RenderResult{true, format_text(diff, options, false), {}};
}

}  // namespace sdiff::render
