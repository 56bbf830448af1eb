#include "diagpack/collect/file_collectors.hpp"

#include "diagpack/util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace diagpack {

namespace {

struct CopyRequest {
    ActionKind kind;
    const char* folder;
    const std::string& pattern;
    const std::string& team;
    const std::string& package_id;
};

CollectionError MakeError(const CopyRequest& req, std::string target, std::string message) {
    CollectionError e;
    e.kind = req.kind;
    e.package_id = req.package_id;
    e.team = req.team;
    e.target = std::move(target);
    e.message = std::move(message);
    return e;
}

// Copy with content, permissions and mtime. Existing targets are replaced.
std::error_code CopyPreservingTimes(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec)
        return ec;
    const auto mtime = fs::last_write_time(src, ec);
    if (ec)
        return ec;
    fs::last_write_time(dst, mtime, ec);
    return ec;
}

ExecutionOutcome CopyMatches(RunContext& ctx,
                             const PathResolver& resolver,
                             const std::string& host_id,
                             const CopyRequest& req,
                             const fs::path& staging_root) {
    ExecutionOutcome outcome;
    if (ctx.CancelRequested())
        return outcome;

    const std::vector<std::string> matches = resolver.Resolve(req.pattern);
    if (matches.empty()) {
        LogDebug("[%s] %s: nothing matches %s",
                 req.package_id.c_str(), ActionKindName(req.kind), req.pattern.c_str());
        return outcome;
    }

    const fs::path dest_dir = TeamDirectory(staging_root, req.package_id, req.folder, req.team);
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        outcome.errors.push_back(MakeError(
            req, req.pattern, "cannot create " + dest_dir.string() + ": " + ec.message()));
        return outcome;
    }

    for (const auto& match : matches) {
        if (ctx.CancelRequested()) {
            LogInfo("[%s] cancellation requested, stopping after %d file(s)",
                    req.package_id.c_str(), outcome.count);
            break;
        }

        const fs::path src(match);
        const fs::path dst = dest_dir / HostPrefixedName(host_id, src.filename().string());
        if (const auto copy_ec = CopyPreservingTimes(src, dst)) {
            outcome.errors.push_back(MakeError(req, match, "copy failed: " + copy_ec.message()));
            continue;
        }
        LogDebug("[%s] copied %s -> %s", req.package_id.c_str(), match.c_str(), dst.c_str());
        ++outcome.count;
    }
    return outcome;
}

} // namespace

FileCollector::FileCollector(std::string host_id, PathResolver resolver)
    : host_id_(std::move(host_id)), resolver_(std::move(resolver)) {}

ExecutionOutcome FileCollector::Execute(RunContext& ctx,
                                        const FileAction& action,
                                        const std::string& package_id,
                                        const fs::path& staging_root) {
    const CopyRequest req{ActionKind::File, kFilesFolder, action.path_pattern, action.team, package_id};
    return CopyMatches(ctx, resolver_, host_id_, req, staging_root);
}

EventLogCollector::EventLogCollector(std::string host_id, PathResolver resolver)
    : host_id_(std::move(host_id)), resolver_(std::move(resolver)) {}

ExecutionOutcome EventLogCollector::Execute(RunContext& ctx,
                                            const EventLogAction& action,
                                            const std::string& package_id,
                                            const fs::path& staging_root) {
    const CopyRequest req{
        ActionKind::EventLog, kEventLogsFolder, action.path_pattern, action.team, package_id};
    return CopyMatches(ctx, resolver_, host_id_, req, staging_root);
}

} // namespace diagpack
