// ==============================================================================
// equality.cpp - Равенство узлов с учётом DiffConfig
// ==============================================================================

#include <sdiff/diff.hpp>

#include <cctype>

namespace sdiff {

std::string normalize_whitespace(std::string_view s) {
    std::string result;
    result.reserve(s.size());

    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

bool nodes_equal(const Value& a, const Value& b, const DiffConfig& config) {
    if (config.ignore_whitespace && a.is_string() && b.is_string()) {
        return normalize_whitespace(a.as_string()) == normalize_whitespace(b.as_string());
    }
    return a.semantic_equals(b);
}

}  // namespace sdiff
