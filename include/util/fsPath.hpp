#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gdfs::util {

// Root-relative form: no leading/trailing slash, no "." segments, ".." resolved lexically and
// clamped at the root. The empty string is the root.
inline std::string normalizePath(const std::string& path) {
    if (path.empty()) return {};
    auto norm = std::filesystem::path("/" + path).lexically_normal().generic_string();
    const auto first = norm.find_first_not_of('/');
    if (first == std::string::npos) return {};
    const auto last = norm.find_last_not_of('/');
    return norm.substr(first, last - first + 1);
}

// Segments of an already normalized path; the root has none.
inline std::vector<std::string> splitPath(const std::string& normalized) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < normalized.size()) {
        auto slash = normalized.find('/', pos);
        if (slash == std::string::npos) slash = normalized.size();
        if (slash > pos) out.emplace_back(normalized.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return out;
}

inline std::string joinPath(const std::vector<std::string>& segments, const size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < segments.size(); ++i) {
        if (!out.empty()) out += '/';
        out += segments[i];
    }
    return out;
}

inline std::string joinPath(const std::vector<std::string>& segments) {
    return joinPath(segments, segments.size());
}

inline std::string joinPath(const std::string& base, const std::string& name) {
    if (base.empty()) return name;
    if (name.empty()) return base;
    return base + '/' + name;
}

inline std::string parentOf(const std::string& normalized) {
    const auto slash = normalized.rfind('/');
    return slash == std::string::npos ? std::string() : normalized.substr(0, slash);
}

inline std::string baseName(const std::string& normalized) {
    const auto slash = normalized.rfind('/');
    return slash == std::string::npos ? normalized : normalized.substr(slash + 1);
}

// True when `path` equals `prefix` or lies below it. The root prefixes everything.
inline bool isPathPrefix(const std::string& prefix, const std::string& path) {
    if (prefix.empty()) return true;
    if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

}
