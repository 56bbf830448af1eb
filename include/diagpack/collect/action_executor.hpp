#pragma once

#include "diagpack/collect/collection_result.hpp"
#include "diagpack/collect/run_context.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace diagpack {

inline constexpr char kFilesFolder[] = "Files";
inline constexpr char kRegistryFolder[] = "RegistryKeys";
inline constexpr char kEventLogsFolder[] = "EventLogs";
inline constexpr char kCommandsFolder[] = "Commands";

struct ExecutionOutcome {
    int count = 0;
    std::vector<CollectionError> errors;
};

// Contract shared by the four executors. Implementations check
// ctx.CancelRequested() before each item they process and return the partial
// outcome as soon as it is set. Failures are reported in the outcome, never thrown.
template <typename Action>
class IActionExecutor {
  public:
    virtual ~IActionExecutor() = default;
    virtual ExecutionOutcome Execute(RunContext& ctx,
                                     const Action& action,
                                     const std::string& package_id,
                                     const std::filesystem::path& staging_root) = 0;
};

// <staging>/<package>/<folder>/<team>
std::filesystem::path TeamDirectory(const std::filesystem::path& staging_root,
                                    std::string_view package_id,
                                    std::string_view folder,
                                    std::string_view team);

// <host>_<name>
std::string HostPrefixedName(std::string_view host_id, std::string_view name);

} // namespace diagpack
