#include "diagpack/collect/action_executor.hpp"

#include "diagpack/manifest/manifest.hpp"
#include "diagpack/util/path_utils.hpp"

namespace diagpack {

std::filesystem::path TeamDirectory(const std::filesystem::path& staging_root,
                                    std::string_view package_id,
                                    std::string_view folder,
                                    std::string_view team) {
    return staging_root / SanitizePathComponent(package_id) / std::string(folder) /
           SanitizePathComponent(team.empty() ? std::string_view(kDefaultTeam) : team);
}

std::string HostPrefixedName(std::string_view host_id, std::string_view name) {
    std::string out = SanitizePathComponent(host_id);
    out.push_back('_');
    out += SanitizePathComponent(name);
    return out;
}

} // namespace diagpack
