#include "cardkit/path_utils.hpp"
#include "cardkit/platform.hpp"

#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

namespace cardkit {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// Splits on both separators so Windows-style input cannot smuggle ".."
std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (is_separator(c)) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace

const char* path_error_name(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "contains_nul";
        case PathError::AbsoluteNotAllowed: return "absolute_not_allowed";
        case PathError::EscapesRoot: return "escapes_root";
    }
    return "unknown";
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string rel = relative_path;
    if (!rel.empty() && is_separator(rel[0])) {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        while (!rel.empty() && is_separator(rel[0])) {
            rel.erase(rel.begin());
        }
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_segments(rel)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::filesystem::path out(root);
    for (const auto& part : normalized) {
        out /= part;
    }
    auto lex_root = std::filesystem::path(root).lexically_normal();
    auto lex_out = out.lexically_normal();

    // Containment check, lexical only
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        if (root_it->empty() && std::next(root_it) == lex_root.end()) {
            break;  // trailing separator on root
        }
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    std::string result = to_portable_path(lex_out.string());
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return {true, result, PathError::None};
}

} // namespace cardkit
