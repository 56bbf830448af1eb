#include "diagpack/collect/path_resolver.hpp"

#include "diagpack/util/logger.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <glob.h>

namespace fs = std::filesystem;

namespace diagpack {

namespace {

bool IsNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// %ProgramFiles(x86)% is a legal Windows variable name.
bool IsPercentNameChar(char c) {
    return IsNameChar(c) || c == '(' || c == ')';
}

std::string ToUpper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

class GlobResult {
  public:
    GlobResult() = default;
    GlobResult(const GlobResult&) = delete;
    GlobResult& operator=(const GlobResult&) = delete;
    ~GlobResult() { ::globfree(&g_); }

    int Run(const std::string& pattern) { return ::glob(pattern.c_str(), 0, nullptr, &g_); }

    std::vector<std::string> Paths() const {
        std::vector<std::string> out;
        out.reserve(g_.gl_pathc);
        for (size_t i = 0; i < g_.gl_pathc; ++i) out.emplace_back(g_.gl_pathv[i]);
        return out;
    }

  private:
    glob_t g_{};
};

std::string_view TrimSpaces(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

PathResolver::PathResolver() : lookup_(&PathResolver::ProcessEnvironment) {}

PathResolver::PathResolver(EnvLookup lookup)
    : lookup_(lookup ? std::move(lookup) : EnvLookup(&PathResolver::ProcessEnvironment)) {}

std::optional<std::string> PathResolver::ProcessEnvironment(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v)
        return std::nullopt;
    return std::string(v);
}

std::string PathResolver::ExpandEnvironment(std::string_view text) const {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
            const size_t close = text.find('}', i + 2);
            if (close != std::string_view::npos && close > i + 2) {
                const std::string name(text.substr(i + 2, close - i - 2));
                if (auto v = lookup_(name)) {
                    out += *v;
                    i = close + 1;
                    continue;
                }
            }
        } else if (c == '$' && i + 1 < text.size() && IsNameStart(text[i + 1])) {
            size_t end = i + 1;
            while (end < text.size() && IsNameChar(text[end])) ++end;
            const std::string name(text.substr(i + 1, end - i - 1));
            if (auto v = lookup_(name)) {
                out += *v;
                i = end;
                continue;
            }
        } else if (c == '%') {
            size_t end = i + 1;
            while (end < text.size() && IsPercentNameChar(text[end])) ++end;
            if (end < text.size() && text[end] == '%' && end > i + 1) {
                const std::string name(text.substr(i + 1, end - i - 1));
                auto v = lookup_(name);
                if (!v)
                    v = lookup_(ToUpper(name));
                if (v) {
                    out += *v;
                    i = end + 1;
                    continue;
                }
            }
        }

        out.push_back(c);
        ++i;
    }
    return out;
}

std::vector<std::string> PathResolver::Resolve(std::string_view pattern) const {
    std::string expanded = ExpandEnvironment(pattern);

    std::string candidate;
    candidate.reserve(expanded.size());
    for (char c : expanded) {
        if (c == '"' || c == '\'')
            continue;
        candidate.push_back(c == '\\' ? '/' : c);
    }
    candidate = std::string(TrimSpaces(candidate));
    if (candidate.empty())
        return {};

    std::vector<std::string> candidates;
    if (candidate.find('*') != std::string::npos) {
        GlobResult g;
        const int rc = g.Run(candidate);
        if (rc == 0) {
            candidates = g.Paths();
        } else if (rc != GLOB_NOMATCH) {
            LogDebug("glob(%s) failed with %d", candidate.c_str(), rc);
        }
    } else {
        candidates.push_back(candidate);
    }

    std::vector<std::string> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(fs::path(c), ec) || ec) {
            LogDebug("Excluding %s: not a regular file", c.c_str());
            continue;
        }
        fs::path abs = fs::absolute(fs::path(c), ec);
        out.push_back(ec ? c : abs.lexically_normal().string());
    }
    return out;
}

} // namespace diagpack
