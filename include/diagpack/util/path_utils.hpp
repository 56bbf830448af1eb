#pragma once

#include <string>
#include <string_view>

namespace diagpack {

// Normalize an archive entry path to a clean relative form:
// - convert '\' to '/'
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeEntryPath(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
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

// Turns a free-text label (team, output name, basename) into a single safe
// path component. Separators and control characters become '_'.
inline std::string SanitizePathComponent(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;

    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '/' || c == '\\' || c == ':' || c < 0x20) {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    if (out.empty() || out == "." || out == "..") return "_";
    return out;
}

} // namespace diagpack
