#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diagpack {

inline constexpr char kDefaultTeam[] = "General";
// OutputFileName value meaning "run the command but do not keep its output".
inline constexpr char kSkipOutputName[] = "skip";

enum class CommandKind {
    Shell,      // wrapped, direct invocation with expression fallback
    BatchShell, // written verbatim as a native script
};

struct FileAction {
    std::string path_pattern;
    std::string team = kDefaultTeam;

    bool operator==(const FileAction&) const = default;
};

struct EventLogAction {
    std::string path_pattern;
    std::string team = kDefaultTeam;

    bool operator==(const EventLogAction&) const = default;
};

struct RegistryAction {
    std::string key_path;
    std::string team = kDefaultTeam;
    std::string output_name;

    bool operator==(const RegistryAction&) const = default;
};

struct CommandAction {
    std::string text;
    CommandKind kind = CommandKind::Shell;
    std::string team = kDefaultTeam;
    std::string output_name;

    bool SkipsOutput() const;

    bool operator==(const CommandAction&) const = default;
};

struct ActionSet {
    std::vector<FileAction> files;
    std::vector<RegistryAction> registries;
    std::vector<EventLogAction> event_logs;
    std::vector<CommandAction> commands;

    std::size_t Size() const {
        return files.size() + registries.size() + event_logs.size() + commands.size();
    }
    bool Empty() const { return Size() == 0; }

    bool operator==(const ActionSet&) const = default;
};

struct Package {
    std::string id;
    ActionSet actions;

    bool operator==(const Package&) const = default;
};

struct Manifest {
    std::vector<Package> packages;

    bool operator==(const Manifest&) const = default;
};

const char* CommandKindName(CommandKind kind);
// "PS", "PowerShell", "Shell" -> Shell; "CMD", "Batch", "BatchShell" -> BatchShell.
std::optional<CommandKind> ParseCommandKind(std::string_view type);

// "HKLM\Software\Vendor\*" -> "HKLM\Software\Vendor"
std::string StripTrailingWildcard(std::string_view key_path);
// "HKLM\Software\Vendor" -> "HKLM_Software_Vendor"
std::string DeriveRegistryOutputName(std::string_view key_path);
// Output name for a command declared without one.
std::string DeriveCommandOutputName(std::string_view text);

} // namespace diagpack
