#pragma once

#include "diagpack/collect/action_executor.hpp"
#include "diagpack/collect/path_resolver.hpp"
#include "diagpack/manifest/manifest.hpp"

#include <string>

namespace diagpack {

// Copies every regular file matched by the action's pattern to
// <staging>/<package>/Files/<team>/<host>_<basename>, keeping content,
// permissions and modification time. A failed copy is recorded and the
// remaining matches are still processed.
class FileCollector final : public IActionExecutor<FileAction> {
  public:
    explicit FileCollector(std::string host_id, PathResolver resolver = PathResolver());

    ExecutionOutcome Execute(RunContext& ctx,
                             const FileAction& action,
                             const std::string& package_id,
                             const std::filesystem::path& staging_root) override;

  private:
    std::string host_id_;
    PathResolver resolver_;
};

// Same rules as FileCollector for event-log storage files, under EventLogs/.
class EventLogCollector final : public IActionExecutor<EventLogAction> {
  public:
    explicit EventLogCollector(std::string host_id, PathResolver resolver = PathResolver());

    ExecutionOutcome Execute(RunContext& ctx,
                             const EventLogAction& action,
                             const std::string& package_id,
                             const std::filesystem::path& staging_root) override;

  private:
    std::string host_id_;
    PathResolver resolver_;
};

} // namespace diagpack
