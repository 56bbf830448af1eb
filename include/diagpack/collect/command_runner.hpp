#pragma once

#include "diagpack/collect/action_executor.hpp"
#include "diagpack/collect/process_launcher.hpp"
#include "diagpack/manifest/manifest.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace diagpack {

// Runs one declared command through a temporary script and stores its combined
// output at <staging>/<package>/Commands/<team>/<host>_<output>.txt, unless the
// output name is the skip sentinel. The script is removed on every exit path.
class CommandRunner final : public IActionExecutor<CommandAction> {
  public:
    struct Options {
        std::string host_id;
        std::string shell_interpreter = "/bin/sh";
        std::string batch_interpreter = "/bin/sh";
        std::string script_dir;  // empty: $TMPDIR or /tmp
        std::chrono::milliseconds timeout = std::chrono::seconds(120);
    };

    CommandRunner(Options opt, std::shared_ptr<const IProcessLauncher> launcher);

    ExecutionOutcome Execute(RunContext& ctx,
                             const CommandAction& action,
                             const std::string& package_id,
                             const std::filesystem::path& staging_root) override;

    // Wrapper for Shell-kind text: exec the named program directly when the
    // text is a plain invocation that resolves, eval the text otherwise.
    static std::string BuildShellWrapper(std::string_view text);
    // No shell syntax, just words.
    static bool LooksLikeInvocation(std::string_view text);
    static std::string ShellQuote(std::string_view s);

  private:
    Options opt_;
    std::shared_ptr<const IProcessLauncher> launcher_;
};

} // namespace diagpack
