#pragma once

#include "diagpack/collect/action_executor.hpp"
#include "diagpack/collect/process_launcher.hpp"
#include "diagpack/manifest/manifest.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace diagpack {

// Runs the host's registry export tool for one key, writing
// <staging>/<package>/RegistryKeys/<team>/<host>_<output>.txt.
// A non-zero exit status is recorded as an error.
class RegistryExporter final : public IActionExecutor<RegistryAction> {
  public:
    struct Options {
        std::string host_id;
        // argv template; "{key}" and "{output}" are substituted per action.
        std::vector<std::string> command_template = DefaultCommandTemplate();
        std::chrono::milliseconds timeout = std::chrono::seconds(120);
    };

    RegistryExporter(Options opt, std::shared_ptr<const IProcessLauncher> launcher);

    ExecutionOutcome Execute(RunContext& ctx,
                             const RegistryAction& action,
                             const std::string& package_id,
                             const std::filesystem::path& staging_root) override;

    static std::vector<std::string> DefaultCommandTemplate();
    static std::vector<std::string> ExpandTemplate(const std::vector<std::string>& tmpl,
                                                   const std::string& key,
                                                   const std::string& output);

  private:
    Options opt_;
    std::shared_ptr<const IProcessLauncher> launcher_;
};

} // namespace diagpack
