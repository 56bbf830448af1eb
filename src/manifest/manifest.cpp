#include "diagpack/manifest/manifest.hpp"

#include "diagpack/util/path_utils.hpp"

#include <cctype>

namespace diagpack {

namespace {

std::string ToLower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

constexpr std::size_t kMaxDerivedNameLength = 64;

} // namespace

bool CommandAction::SkipsOutput() const {
    return ToLower(Trim(output_name)) == kSkipOutputName;
}

const char* CommandKindName(CommandKind kind) {
    switch (kind) {
        case CommandKind::Shell:      return "Shell";
        case CommandKind::BatchShell: return "BatchShell";
    }
    return "Unknown";
}

std::optional<CommandKind> ParseCommandKind(std::string_view type) {
    const std::string t = ToLower(Trim(type));
    if (t == "ps" || t == "powershell" || t == "shell")
        return CommandKind::Shell;
    if (t == "cmd" || t == "batch" || t == "batchshell")
        return CommandKind::BatchShell;
    return std::nullopt;
}

std::string StripTrailingWildcard(std::string_view key_path) {
    std::string_view k = Trim(key_path);
    while (!k.empty() && (k.back() == '*' || k.back() == '\\' || k.back() == '/')) {
        k.remove_suffix(1);
    }
    return std::string(k);
}

std::string DeriveRegistryOutputName(std::string_view key_path) {
    std::string name = StripTrailingWildcard(key_path);
    for (char& c : name) {
        if (c == '\\' || c == '/')
            c = '_';
    }
    return SanitizePathComponent(name);
}

std::string DeriveCommandOutputName(std::string_view text) {
    std::string name;
    for (char c : Trim(text)) {
        if (name.size() >= kMaxDerivedNameLength)
            break;
        const unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '.') {
            name.push_back(c);
        } else if (!name.empty() && name.back() != '_') {
            name.push_back('_');
        }
    }
    while (!name.empty() && name.back() == '_') name.pop_back();
    return name.empty() ? std::string("command") : name;
}

} // namespace diagpack
