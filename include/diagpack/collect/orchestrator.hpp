#pragma once

#include "diagpack/collect/action_executor.hpp"
#include "diagpack/collect/archiver.hpp"
#include "diagpack/collect/collection_result.hpp"
#include "diagpack/collect/process_launcher.hpp"
#include "diagpack/collect/run_context.hpp"
#include "diagpack/collect/staging_tree.hpp"
#include "diagpack/manifest/manifest.hpp"
#include "diagpack/manifest/manifest_source.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace diagpack {

// Drives one collection run:
//   Idle -> Preparing -> RunningPackages -> Archiving -> Finished(Success|Cancelled|Failed)
// Packages run in manifest order; inside a package the groups run as
// Files, Registries, EventLogs, Commands. The staging tree is removed before
// the run enters Finished, whatever the outcome.
class CollectionOrchestrator {
  public:
    struct Options {
        std::string staging_dir;  // empty: fresh mkdtemp() directory
        std::string output_dir = ".";
        std::string host_id;      // empty: local host name
        std::chrono::milliseconds command_timeout = std::chrono::seconds(120);
        std::size_t max_command_output_bytes = PosixProcessLauncher::kDefaultMaxOutputBytes;
        std::string shell_interpreter = "/bin/sh";
        std::string batch_interpreter = "/bin/sh";
        std::vector<std::string> registry_export_command;  // empty: platform default
    };

    struct Executors {
        std::unique_ptr<IActionExecutor<FileAction>> files;
        std::unique_ptr<IActionExecutor<RegistryAction>> registries;
        std::unique_ptr<IActionExecutor<EventLogAction>> event_logs;
        std::unique_ptr<IActionExecutor<CommandAction>> commands;
    };

    // Progress shares: setup and manifest acquisition, then the package loop.
    static constexpr int kSetupPercent = 10;
    static constexpr int kManifestPercent = 25;
    static constexpr int kPackagesDonePercent = 95;

    // Without a launcher, commands run through a PosixProcessLauncher capped at
    // max_command_output_bytes.
    explicit CollectionOrchestrator(Options opt,
                                    std::shared_ptr<const IProcessLauncher> launcher = nullptr);
    // Missing executors are filled with the defaults.
    CollectionOrchestrator(Options opt, Executors executors);

    CollectionResult Run(RunContext& ctx, IManifestSource& source);
    CollectionResult Run(RunContext& ctx, const Manifest& manifest);

    void SetArchiveClock(Archiver::Clock clock) { archive_clock_ = std::move(clock); }

    const std::string& HostId() const { return opt_.host_id; }

  private:
    Result Prepare(RunContext& ctx);
    CollectionResult RunPackages(RunContext& ctx, const Manifest& manifest);
    void RunPackage(RunContext& ctx, const Package& pkg, PerPackageResult& out);
    CollectionResult Finish(RunContext& ctx, CollectionResult result, RunOutcome outcome);
    CollectionResult Fail(RunContext& ctx, CollectionResult result, std::string error);

    void FillDefaultExecutors(std::shared_ptr<const IProcessLauncher> launcher);

    Options opt_;
    Executors executors_;
    Archiver::Clock archive_clock_;
    StagingTree staging_;
};

} // namespace diagpack
