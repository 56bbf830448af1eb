#include "diagpack/collect/command_runner.hpp"

#include "diagpack/io/temp_file.hpp"
#include "diagpack/util/logger.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace diagpack {

namespace {

constexpr std::string_view kShellMetaChars = "|&;<>()$`\\\"'*?[]#~{}=!\n\r";

std::vector<std::string> SplitWords(std::string_view text) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > start)
            words.emplace_back(text.substr(start, i - start));
    }
    return words;
}

std::string ScriptDirectory(const std::string& configured) {
    if (!configured.empty())
        return configured;
    const char* tmp = std::getenv("TMPDIR");
    return (tmp && *tmp) ? std::string(tmp) : std::string("/tmp");
}

Result WriteOutputFile(const fs::path& path, const std::string& data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good())
        return Result::Fail(-1, "cannot open " + path.string());
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    os.close();
    if (!os)
        return Result::Fail(-1, "write failed: " + path.string());
    return Result::Ok();
}

} // namespace

CommandRunner::CommandRunner(Options opt, std::shared_ptr<const IProcessLauncher> launcher)
    : opt_(std::move(opt)),
      launcher_(launcher ? std::move(launcher) : DefaultProcessLauncher()) {}

std::string CommandRunner::ShellQuote(std::string_view s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

bool CommandRunner::LooksLikeInvocation(std::string_view text) {
    if (text.find_first_of(kShellMetaChars) != std::string_view::npos)
        return false;
    return !SplitWords(text).empty();
}

std::string CommandRunner::BuildShellWrapper(std::string_view text) {
    std::string script = "#!/bin/sh\nexec 2>&1\n";
    script += "diagpack_cmd=" + ShellQuote(text) + "\n";

    if (LooksLikeInvocation(text)) {
        const auto words = SplitWords(text);
        std::string invocation = ShellQuote(words.front());
        for (size_t i = 1; i < words.size(); ++i) {
            invocation += " " + ShellQuote(words[i]);
        }
        script += "if command -v " + ShellQuote(words.front()) + " >/dev/null 2>&1; then\n";
        script += "    exec " + invocation + "\n";
        script += "fi\n";
    }

    script += "eval \"$diagpack_cmd\"\n";
    return script;
}

ExecutionOutcome CommandRunner::Execute(RunContext& ctx,
                                        const CommandAction& action,
                                        const std::string& package_id,
                                        const fs::path& staging_root) {
    ExecutionOutcome outcome;
    if (ctx.CancelRequested())
        return outcome;

    auto fail = [&](std::string message) {
        CollectionError e;
        e.kind = ActionKind::Command;
        e.package_id = package_id;
        e.team = action.team;
        e.target = action.text;
        e.message = std::move(message);
        outcome.errors.push_back(std::move(e));
        return outcome;
    };

    std::string interpreter;
    std::string script_body;
    switch (action.kind) {
        case CommandKind::Shell:
            interpreter = opt_.shell_interpreter;
            script_body = BuildShellWrapper(action.text);
            break;
        case CommandKind::BatchShell:
            interpreter = opt_.batch_interpreter;
            script_body = action.text + "\n";
            break;
    }

    ProcessOutput result;
    {
        TempFile script;
        if (auto r = TempFile::Create(ScriptDirectory(opt_.script_dir), "diagpack-cmd-", ".sh", script);
            !r.is_ok()) {
            return fail(r.msg);
        }
        if (auto r = script.WriteAll(script_body); !r.is_ok())
            return fail(r.msg);
        script.Close();

        LogInfo("[%s] running %s command: %s",
                package_id.c_str(), CommandKindName(action.kind), action.text.c_str());
        auto run = launcher_->Run({interpreter, script.Path()}, opt_.timeout);
        if (!run)
            return fail(run.error());
        result = std::move(*run);
    }

    if (result.timed_out)
        return fail("command timed out after " + std::to_string(opt_.timeout.count()) + " ms");
    if (result.exit_code != 0) {
        LogWarn("[%s] command exited with status %d: %s",
                package_id.c_str(), result.exit_code, action.text.c_str());
    }

    if (action.SkipsOutput()) {
        LogInfo("[%s] output of '%s' discarded (skip)", package_id.c_str(), action.text.c_str());
        return outcome;
    }

    const fs::path dest_dir = TeamDirectory(staging_root, package_id, kCommandsFolder, action.team);
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec)
        return fail("cannot create " + dest_dir.string() + ": " + ec.message());

    const fs::path output = dest_dir / (HostPrefixedName(opt_.host_id, action.output_name) + ".txt");
    if (auto r = WriteOutputFile(output, result.output); !r.is_ok())
        return fail(r.msg);

    outcome.count = 1;
    if (result.truncated)
        return fail("output truncated at " + std::to_string(result.output.size()) + " bytes");
    return outcome;
}

} // namespace diagpack
