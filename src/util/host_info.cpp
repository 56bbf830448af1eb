#include "diagpack/util/host_info.hpp"

#include "diagpack/util/path_utils.hpp"

#include <array>
#include <climits>
#include <unistd.h>

namespace diagpack {

std::string LocalHostId() {
    std::array<char, HOST_NAME_MAX + 1> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    std::string name(buf.data());
    const auto dot = name.find('.');
    if (dot != std::string::npos && dot > 0) {
        name.resize(dot);
    }
    return SanitizePathComponent(name);
}

std::string FormatUtcStamp(std::time_t t) {
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) {
        return "00_00_0000_00_00";
    }
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%m_%d_%Y_%H_%M", &tm);
    return buf;
}

std::string ArchiveFileName(const std::string& host_id, std::time_t t) {
    return host_id + "_CollectedData_" + FormatUtcStamp(t) + "_UTC.zip";
}

} // namespace diagpack
