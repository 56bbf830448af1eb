#include "diagpack/collect/registry_exporter.hpp"

#include "diagpack/util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace diagpack {

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string FirstLine(const std::string& text) {
    const auto end = text.find_first_of("\r\n");
    return text.substr(0, end);
}

} // namespace

RegistryExporter::RegistryExporter(Options opt, std::shared_ptr<const IProcessLauncher> launcher)
    : opt_(std::move(opt)),
      launcher_(launcher ? std::move(launcher) : DefaultProcessLauncher()) {
    if (opt_.command_template.empty())
        opt_.command_template = DefaultCommandTemplate();
}

std::vector<std::string> RegistryExporter::DefaultCommandTemplate() {
    return {"reg", "export", "{key}", "{output}", "/y"};
}

std::vector<std::string> RegistryExporter::ExpandTemplate(const std::vector<std::string>& tmpl,
                                                          const std::string& key,
                                                          const std::string& output) {
    std::vector<std::string> argv;
    argv.reserve(tmpl.size());
    for (std::string arg : tmpl) {
        ReplaceAll(arg, "{key}", key);
        ReplaceAll(arg, "{output}", output);
        argv.push_back(std::move(arg));
    }
    return argv;
}

ExecutionOutcome RegistryExporter::Execute(RunContext& ctx,
                                           const RegistryAction& action,
                                           const std::string& package_id,
                                           const fs::path& staging_root) {
    ExecutionOutcome outcome;
    if (ctx.CancelRequested())
        return outcome;

    auto fail = [&](std::string message) {
        CollectionError e;
        e.kind = ActionKind::Registry;
        e.package_id = package_id;
        e.team = action.team;
        e.target = action.key_path;
        e.message = std::move(message);
        outcome.errors.push_back(std::move(e));
        return outcome;
    };

    const fs::path dest_dir = TeamDirectory(staging_root, package_id, kRegistryFolder, action.team);
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec)
        return fail("cannot create " + dest_dir.string() + ": " + ec.message());

    const fs::path output = dest_dir / (HostPrefixedName(opt_.host_id, action.output_name) + ".txt");
    const auto argv = ExpandTemplate(opt_.command_template, action.key_path, output.string());

    LogInfo("[%s] exporting registry key %s", package_id.c_str(), action.key_path.c_str());
    auto run = launcher_->Run(argv, opt_.timeout);
    if (!run)
        return fail(run.error());
    if (run->timed_out)
        return fail("registry export timed out after " + std::to_string(opt_.timeout.count()) + " ms");
    if (run->exit_code != 0) {
        std::string msg = "registry export exited with status " + std::to_string(run->exit_code);
        const std::string detail = FirstLine(run->output);
        if (!detail.empty())
            msg += ": " + detail;
        return fail(std::move(msg));
    }
    if (!fs::exists(output, ec))
        return fail("registry export produced no output file");

    outcome.count = 1;
    return outcome;
}

} // namespace diagpack
