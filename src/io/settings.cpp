// ==============================================================================
// settings.cpp - Файл настроек (.sdiff.yaml)
// ==============================================================================

#include <sdiff/platform.hpp>
#include <sdiff/settings.hpp>

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace sdiff::io {

namespace {

SettingsResult fail(std::string message) {
    SettingsResult result;
    result.ok = false;
    result.error = std::move(message);
    return result;
}

std::string invalid_value(const std::string& key, const std::string& expected) {
    return "invalid value for '" + key + "': expected " + expected;
}

/// Список шаблонов: строка или последовательность строк
bool read_patterns(const YAML::Node& node, std::vector<std::string>& out) {
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return true;
    }
    if (!node.IsSequence()) {
        return false;
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return false;
        }
        out.push_back(item.as<std::string>());
    }
    return true;
}

}  // anonymous namespace

SettingsResult parse_settings(std::string_view yaml_text) {
    SettingsResult result;

    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));

        // Пустой файл - пустые настройки
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            return fail("settings file must contain a mapping");
        }

        Settings& s = result.settings;
        for (const auto& kv : root) {
            const std::string key = kv.first.as<std::string>();
            const YAML::Node& value = kv.second;

            if (key == "format") {
                s.format = render::render_format_from_string(value.as<std::string>());
                if (!s.format) {
                    return fail(invalid_value(key, "terminal, plain or json"));
                }
            } else if (key == "array_diff") {
                s.array_diff = array_diff_strategy_from_string(value.as<std::string>());
                if (!s.array_diff) {
                    return fail(invalid_value(key, "positional or lcs"));
                }
            } else if (key == "ignore_whitespace") {
                s.ignore_whitespace = value.as<bool>();
            } else if (key == "null_as_missing") {
                s.null_as_missing = value.as<bool>();
            } else if (key == "compact") {
                s.compact = value.as<bool>();
            } else if (key == "show_values") {
                s.show_values = value.as<bool>();
            } else if (key == "max_value_length") {
                long long n = value.as<long long>();
                if (n < 0) {
                    return fail(invalid_value(key, "a non-negative integer"));
                }
                s.max_value_length = static_cast<std::size_t>(n);
            } else if (key == "ignore") {
                if (!read_patterns(value, s.ignore)) {
                    return fail(invalid_value(key, "a list of patterns"));
                }
            } else if (key == "only") {
                if (!read_patterns(value, s.only)) {
                    return fail(invalid_value(key, "a list of patterns"));
                }
            } else {
                return fail("unknown settings key '" + key + "'");
            }
        }
    } catch (const YAML::BadConversion& e) {
        return fail(std::string("invalid settings value: ") + e.what());
    } catch (const YAML::Exception& e) {
        return fail(std::string("settings parse error: ") + e.what());
    }

    result.ok = true;
    return result;
}

SettingsResult load_settings(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return fail("cannot open settings file: " + platform::path_to_utf8(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    SettingsResult result = parse_settings(buffer.str());
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

void apply_settings(const Settings& settings, DiffConfig& diff_config, FilterConfig& filter,
                    render::RenderOptions& render_options, render::RenderFormat& format) {
    if (settings.format) {
        format = *settings.format;
    }
    if (settings.array_diff) {
        diff_config.array_diff_strategy = *settings.array_diff;
    }
    if (settings.ignore_whitespace) {
        diff_config.ignore_whitespace = *settings.ignore_whitespace;
    }
    if (settings.null_as_missing) {
        diff_config.treat_null_as_missing = *settings.null_as_missing;
    }
    if (settings.compact) {
        render_options.compact = *settings.compact;
    }
    if (settings.show_values) {
        render_options.show_values = *settings.show_values;
    }
    if (settings.max_value_length) {
        render_options.max_value_length = *settings.max_value_length;
    }
    for (const auto& p : settings.ignore) {
        filter.ignore(p);
    }
    for (const auto& p : settings.only) {
        filter.only(p);
    }
}

}  // namespace sdiff::io
