#include "diagpack/collect/orchestrator.hpp"

#include "diagpack/collect/command_runner.hpp"
#include "diagpack/collect/file_collectors.hpp"
#include "diagpack/collect/registry_exporter.hpp"
#include "diagpack/crypto/sha256.hpp"
#include "diagpack/manifest/manifest_parser.hpp"
#include "diagpack/util/host_info.hpp"
#include "diagpack/util/logger.hpp"
#include "diagpack/util/path_utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace diagpack {

namespace {

// Returns false when cancellation stopped the group early.
template <typename Action>
bool RunGroup(RunContext& ctx,
              IActionExecutor<Action>& executor,
              const std::vector<Action>& actions,
              const std::string& package_id,
              const fs::path& staging_root,
              int& counter,
              std::vector<CollectionError>& errors) {
    for (const auto& action : actions) {
        if (ctx.CancelRequested())
            return false;

        ExecutionOutcome outcome = executor.Execute(ctx, action, package_id, staging_root);
        counter += outcome.count;
        for (auto& e : outcome.errors) {
            ctx.Notify(LogLevel::Warn,
                       "[%s] %s action failed (%s): %s",
                       package_id.c_str(),
                       ActionKindName(e.kind),
                       e.target.c_str(),
                       e.message.c_str());
            errors.push_back(std::move(e));
        }
    }
    return !ctx.CancelRequested();
}

} // namespace

CollectionOrchestrator::CollectionOrchestrator(Options opt,
                                               std::shared_ptr<const IProcessLauncher> launcher)
    : opt_(std::move(opt)) {
    opt_.host_id = opt_.host_id.empty() ? LocalHostId() : SanitizePathComponent(opt_.host_id);
    FillDefaultExecutors(std::move(launcher));
}

CollectionOrchestrator::CollectionOrchestrator(Options opt, Executors executors)
    : opt_(std::move(opt)), executors_(std::move(executors)) {
    opt_.host_id = opt_.host_id.empty() ? LocalHostId() : SanitizePathComponent(opt_.host_id);
    FillDefaultExecutors(nullptr);
}

void CollectionOrchestrator::FillDefaultExecutors(std::shared_ptr<const IProcessLauncher> launcher) {
    if (!launcher)
        launcher = std::make_shared<PosixProcessLauncher>(opt_.max_command_output_bytes);

    if (!executors_.files)
        executors_.files = std::make_unique<FileCollector>(opt_.host_id);
    if (!executors_.registries) {
        RegistryExporter::Options ropt;
        ropt.host_id = opt_.host_id;
        if (!opt_.registry_export_command.empty())
            ropt.command_template = opt_.registry_export_command;
        ropt.timeout = opt_.command_timeout;
        executors_.registries = std::make_unique<RegistryExporter>(std::move(ropt), launcher);
    }
    if (!executors_.event_logs)
        executors_.event_logs = std::make_unique<EventLogCollector>(opt_.host_id);
    if (!executors_.commands) {
        CommandRunner::Options copt;
        copt.host_id = opt_.host_id;
        copt.shell_interpreter = opt_.shell_interpreter;
        copt.batch_interpreter = opt_.batch_interpreter;
        copt.timeout = opt_.command_timeout;
        executors_.commands = std::make_unique<CommandRunner>(std::move(copt), launcher);
    }
}

Result CollectionOrchestrator::Prepare(RunContext& ctx) {
    ctx.EnterState(RunState::Preparing);
    auto r = StagingTree::Create(opt_.staging_dir, staging_);
    if (!r.is_ok())
        return r;
    ctx.Notify(LogLevel::Info, "Staging directory: %s", staging_.Dir().c_str());
    ctx.ReportProgress(kSetupPercent, "Staging directory ready");
    return Result::Ok();
}

CollectionResult CollectionOrchestrator::Run(RunContext& ctx, IManifestSource& source) {
    if (auto r = Prepare(ctx); !r.is_ok())
        return Fail(ctx, CollectionResult{}, "staging: " + r.msg);

    ctx.Notify(LogLevel::Info, "Reading manifest from %s", source.Describe().c_str());
    auto bytes = source.Fetch();
    if (!bytes)
        return Fail(ctx, CollectionResult{}, "manifest: " + bytes.error());

    ManifestParser parser;
    auto manifest = parser.Parse(*bytes);
    if (!manifest)
        return Fail(ctx, CollectionResult{}, "manifest: " + manifest.error());

    ctx.ReportProgress(kManifestPercent, "Manifest loaded");
    return RunPackages(ctx, *manifest);
}

CollectionResult CollectionOrchestrator::Run(RunContext& ctx, const Manifest& manifest) {
    if (auto r = Prepare(ctx); !r.is_ok())
        return Fail(ctx, CollectionResult{}, "staging: " + r.msg);

    ctx.ReportProgress(kManifestPercent, "Manifest loaded");
    return RunPackages(ctx, manifest);
}

CollectionResult CollectionOrchestrator::RunPackages(RunContext& ctx, const Manifest& manifest) {
    CollectionResult result;
    ctx.EnterState(RunState::RunningPackages);

    const std::size_t total = manifest.packages.size();
    ctx.Notify(LogLevel::Info, "Collecting %zu package(s) as host %s", total, opt_.host_id.c_str());

    for (std::size_t i = 0; i < total; ++i) {
        if (ctx.CancelRequested())
            return Finish(ctx, std::move(result), RunOutcome::Cancelled);

        const Package& pkg = manifest.packages[i];

        RunEvent started;
        started.type = RunEvent::Type::PackageStarted;
        started.state = RunState::RunningPackages;
        started.package_id = pkg.id;
        started.package_index = i;
        started.percent = ctx.Progress();
        ctx.Emit(std::move(started));
        ctx.Notify(LogLevel::Info, "Package %s (%zu/%zu): %zu action(s)",
                   pkg.id.c_str(), i + 1, total, pkg.actions.Size());

        // Duplicate ids share one result entry and one staging subtree.
        PerPackageResult& pr = result.per_package[pkg.id];
        RunPackage(ctx, pkg, pr);

        const int percent =
            kManifestPercent +
            static_cast<int>((kPackagesDonePercent - kManifestPercent) * (i + 1) / total);

        RunEvent finished;
        finished.type = RunEvent::Type::PackageFinished;
        finished.state = RunState::RunningPackages;
        finished.package_id = pkg.id;
        finished.package_index = i;
        finished.percent = percent;
        finished.message = std::to_string(pr.TotalCollected()) + " item(s), " +
                           std::to_string(pr.errors.size()) + " error(s)";
        ctx.Emit(std::move(finished));
        ctx.ReportProgress(percent, "Package " + pkg.id + " done");

        if (ctx.CancelRequested())
            return Finish(ctx, std::move(result), RunOutcome::Cancelled);
    }

    ctx.EnterState(RunState::Archiving);
    const Archiver archiver(opt_.host_id, archive_clock_);
    std::string archive_path;
    if (auto r = archiver.Archive(fs::path(staging_.Dir()), fs::path(opt_.output_dir), archive_path);
        !r.is_ok()) {
        return Fail(ctx, std::move(result), "archive: " + r.msg);
    }
    result.archive_path = archive_path;

    std::string digest;
    if (auto r = Sha256HexFile(archive_path, digest); r.is_ok()) {
        result.archive_sha256 = digest;
    } else {
        LogWarn("Cannot hash %s: %s", archive_path.c_str(), r.msg.c_str());
    }

    std::error_code ec;
    const auto size = fs::file_size(archive_path, ec);
    ctx.Notify(LogLevel::Info, "Archive %s (%llu bytes) sha256=%s",
               archive_path.c_str(),
               ec ? 0ULL : static_cast<unsigned long long>(size),
               result.archive_sha256.empty() ? "-" : result.archive_sha256.c_str());

    return Finish(ctx, std::move(result), RunOutcome::Success);
}

void CollectionOrchestrator::RunPackage(RunContext& ctx, const Package& pkg, PerPackageResult& out) {
    const fs::path root(staging_.Dir());
    const ActionSet& a = pkg.actions;

    if (!RunGroup(ctx, *executors_.files, a.files, pkg.id, root, out.files_collected, out.errors))
        return;
    if (!RunGroup(ctx, *executors_.registries, a.registries, pkg.id, root,
                  out.registries_collected, out.errors))
        return;
    if (!RunGroup(ctx, *executors_.event_logs, a.event_logs, pkg.id, root,
                  out.event_logs_collected, out.errors))
        return;
    (void)RunGroup(ctx, *executors_.commands, a.commands, pkg.id, root,
                   out.commands_collected, out.errors);
}

CollectionResult CollectionOrchestrator::Fail(RunContext& ctx,
                                              CollectionResult result,
                                              std::string error) {
    ctx.Notify(LogLevel::Error, "Collection failed: %s", error.c_str());
    result.fatal_error = std::move(error);
    return Finish(ctx, std::move(result), RunOutcome::Failed);
}

CollectionResult CollectionOrchestrator::Finish(RunContext& ctx,
                                                CollectionResult result,
                                                RunOutcome outcome) {
    if (auto r = staging_.Remove(); !r.is_ok()) {
        LogError("%s", r.msg.c_str());
    }

    result.outcome = outcome;
    result.cancelled = (outcome == RunOutcome::Cancelled);
    if (outcome == RunOutcome::Cancelled)
        ctx.Notify(LogLevel::Warn, "Collection cancelled");
    if (outcome == RunOutcome::Success)
        ctx.ReportProgress(100, "Collection complete");

    ctx.EnterState(RunState::Finished, outcome);
    return result;
}

} // namespace diagpack
