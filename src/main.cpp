#include "diagpack/collect/orchestrator.hpp"
#include "diagpack/collect/report.hpp"
#include "diagpack/manifest/manifest_source.hpp"
#include "diagpack/system/signals.hpp"
#include "diagpack/util/collector_config.hpp"
#include "diagpack/util/logger.hpp"
#include "diagpack/util/progress_sinks.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 3;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -m <manifest|-> [-o <dir>] [-c <config.json>] [-s <dir>] [-t <sec>]\n"
        "\n"
        "Options:\n"
        "  -m, --manifest        Manifest XML path or '-' for stdin\n"
        "  -o, --output          Directory that receives the archive (default .)\n"
        "  -c, --config          JSON configuration file\n"
        "  -s, --staging         Staging directory (default: fresh directory under $TMPDIR)\n"
        "  -t, --timeout         Per-command timeout in seconds (default 120)\n"
        "  -r, --report          Write a JSON run report to this path\n"
        "  -p, --progress-file   Keep a JSON progress document at this path\n"
        "  -v, --verbose         Debug logging\n"
        "  -q, --quiet           Errors only, no progress line\n"
        "  -h, --help            Show this help\n",
        argv);
}

int ExitCodeFor(diagpack::RunOutcome outcome) {
    switch (outcome) {
        case diagpack::RunOutcome::Success:   return kExitSuccess;
        case diagpack::RunOutcome::Cancelled: return kExitCancelled;
        default:                              return kExitFailed;
    }
}

void PrintSummary(const diagpack::CollectionResult &res) {
    for (const auto &[id, r] : res.per_package) {
        std::fprintf(stderr,
                     "  %-24s files=%d registry=%d eventlogs=%d commands=%d errors=%zu\n",
                     id.c_str(),
                     r.files_collected,
                     r.registries_collected,
                     r.event_logs_collected,
                     r.commands_collected,
                     r.errors.size());
    }
    if (res.archive_path) {
        std::fprintf(stderr, "Archive: %s\n", res.archive_path->c_str());
        if (!res.archive_sha256.empty())
            std::fprintf(stderr, "SHA-256: %s\n", res.archive_sha256.c_str());
    }
}

} // namespace

int main(int argc, char **argv) {
    diagpack::InstallSignalHandlers();

    const char *manifest_path = nullptr;
    const char *output_cli = nullptr;
    const char *config_path = nullptr;
    const char *staging_cli = nullptr;
    const char *report_cli = nullptr;
    const char *progress_file_cli = nullptr;
    std::optional<std::uint64_t> timeout_cli;
    bool verbose = false;
    bool quiet = false;

    static option long_opts[] = {
        {"manifest", required_argument, nullptr, 'm'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"staging", required_argument, nullptr, 's'},
        {"timeout", required_argument, nullptr, 't'},
        {"report", required_argument, nullptr, 'r'},
        {"progress-file", required_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hm:o:c:s:t:r:p:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitSuccess;

            case 'm':
                manifest_path = optarg;
                break;

            case 'o':
                output_cli = optarg;
                break;

            case 'c':
                config_path = optarg;
                break;

            case 's':
                staging_cli = optarg;
                break;

            case 'r':
                report_cli = optarg;
                break;

            case 'p':
                progress_file_cli = optarg;
                break;

            case 't': {
                char *end = nullptr;
                unsigned long long v = std::strtoull(optarg, &end, 10);
                if (!end || *end != '\0' || v == 0) {
                    std::fprintf(stderr, "Invalid --timeout: %s\n", optarg);
                    return kExitUsage;
                }
                timeout_cli = static_cast<std::uint64_t>(v);
                break;
            }

            case 'v':
                verbose = true;
                break;

            case 'q':
                quiet = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (!manifest_path || optind != argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    diagpack::config::CollectorConfig cfg;
    if (config_path) {
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailed;
        }
    }

    auto &logger = diagpack::Logger::Instance();
    logger.SetLevel(cfg.log_level.value_or(diagpack::LogLevel::Info));
    if (verbose)
        logger.SetLevel(diagpack::LogLevel::Debug);
    if (quiet)
        logger.SetLevel(diagpack::LogLevel::Error);

    diagpack::CollectionOrchestrator::Options opt;
    if (cfg.staging_dir) opt.staging_dir = *cfg.staging_dir;
    if (cfg.output_dir) opt.output_dir = *cfg.output_dir;
    if (cfg.host_id) opt.host_id = *cfg.host_id;
    if (cfg.shell_interpreter) opt.shell_interpreter = *cfg.shell_interpreter;
    if (cfg.batch_interpreter) opt.batch_interpreter = *cfg.batch_interpreter;
    if (cfg.registry_export_command) opt.registry_export_command = *cfg.registry_export_command;
    if (cfg.command_timeout_sec)
        opt.command_timeout = std::chrono::seconds(*cfg.command_timeout_sec);
    if (cfg.max_command_output_bytes)
        opt.max_command_output_bytes = static_cast<std::size_t>(*cfg.max_command_output_bytes);

    if (staging_cli) opt.staging_dir = staging_cli;
    if (output_cli) opt.output_dir = output_cli;
    if (timeout_cli) opt.command_timeout = std::chrono::seconds(*timeout_cli);

    std::string report_path = cfg.report_path.value_or("");
    if (report_cli) report_path = report_cli;
    std::string progress_file = cfg.progress_file.value_or("");
    if (progress_file_cli) progress_file = progress_file_cli;

    std::vector<std::unique_ptr<diagpack::IProgress>> sinks;
    const bool console_progress = cfg.progress.value_or(isatty(STDERR_FILENO) != 0) && !quiet;
    if (console_progress)
        sinks.push_back(std::make_unique<diagpack::ConsoleProgressSink>());
    if (!progress_file.empty())
        sinks.push_back(std::make_unique<diagpack::FileProgressSink>(progress_file));

    diagpack::CollectionOrchestrator orchestrator(std::move(opt));
    diagpack::FileManifestSource source(manifest_path);
    diagpack::RunContext ctx;
    diagpack::CollectionResult result;

    std::thread worker([&] { result = orchestrator.Run(ctx, source); });

    bool finished = false;
    while (!finished) {
        if (diagpack::g_cancel.load(std::memory_order_relaxed) && !ctx.CancelRequested()) {
            LogWarn("Received %s, cancelling collection (repeat to abort)",
                    diagpack::g_cancel_signal.load() == SIGTERM ? "SIGTERM" : "SIGINT");
            ctx.RequestCancel();
        }

        auto ev = ctx.WaitForEvent(std::chrono::milliseconds(200));
        if (!ev)
            continue;

        switch (ev->type) {
            case diagpack::RunEvent::Type::Progress: {
                const diagpack::ProgressEvent pe{ev->message, ev->percent};
                for (auto &s : sinks)
                    s->OnProgress(pe);
                break;
            }
            case diagpack::RunEvent::Type::StateChanged:
                LogDebug("State: %s", diagpack::RunStateName(ev->state));
                finished = (ev->state == diagpack::RunState::Finished);
                break;
            default:
                break;
        }
    }

    worker.join();
    diagpack::ClearProgressLine();

    if (!quiet)
        PrintSummary(result);
    if (result.fatal_error)
        std::fprintf(stderr, "ERROR: %s\n", result.fatal_error->c_str());

    if (!report_path.empty()) {
        if (auto r = diagpack::WriteReportFile(result, report_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            if (result.outcome == diagpack::RunOutcome::Success)
                return kExitFailed;
        }
    }

    const int code = ExitCodeFor(result.outcome);
    LogInfo("Collection finished: %s (exit %d)", diagpack::RunOutcomeName(result.outcome), code);
    return code;
}
