#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace diagpack {

enum class ActionKind {
    File,
    Registry,
    EventLog,
    Command,
};

const char* ActionKindName(ActionKind kind);

// A failure of one action (or one matched item of it). Recorded, never fatal.
struct CollectionError {
    ActionKind kind = ActionKind::File;
    std::string package_id;
    std::string team;
    std::string target;  // pattern, key, file or command text the failure refers to
    std::string message;
};

struct PerPackageResult {
    int files_collected = 0;
    int registries_collected = 0;
    int event_logs_collected = 0;
    int commands_collected = 0;
    std::vector<CollectionError> errors;

    int TotalCollected() const {
        return files_collected + registries_collected + event_logs_collected + commands_collected;
    }
};

enum class RunOutcome {
    None,
    Success,
    Cancelled,
    Failed,
};

const char* RunOutcomeName(RunOutcome outcome);

struct CollectionResult {
    std::map<std::string, PerPackageResult> per_package;
    std::optional<std::string> archive_path;
    std::string archive_sha256;
    bool cancelled = false;
    RunOutcome outcome = RunOutcome::None;
    // Manifest, staging or archive failure that ended the run.
    std::optional<std::string> fatal_error;

    std::size_t ErrorCount() const {
        std::size_t n = 0;
        for (const auto& [id, r] : per_package) n += r.errors.size();
        return n;
    }
};

} // namespace diagpack
