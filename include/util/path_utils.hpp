#pragma once

#include <string>
#include <string_view>

namespace extupd {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Text after the last '/' (the whole string when there is none).
inline std::string LastPathSegment(std::string_view url) {
    const auto pos = url.rfind('/');
    if (pos == std::string_view::npos) return std::string(url);
    return std::string(url.substr(pos + 1));
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "foo-1.2.zip" -> "foo-1.2"; names without a dot (or dot-files) are returned unchanged.
inline std::string NameWithoutExtension(std::string_view name) {
    const auto pos = name.rfind('.');
    if (pos == std::string_view::npos || pos == 0) return std::string(name);
    return std::string(name.substr(0, pos));
}

// A single path component that is safe to create on any common filesystem.
inline bool IsValidFileName(std::string_view name) {
    if (name.empty() || name.size() > 255) return false;
    if (name == "." || name == "..") return false;
    for (const char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) return false;
        switch (c) {
            case '/': case '\\': case '<': case '>': case ':':
            case '"': case '|': case '?': case '*':
                return false;
            default:
                break;
        }
    }
    return true;
}

} // namespace extupd
