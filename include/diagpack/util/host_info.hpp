#pragma once

#include <ctime>
#include <string>

namespace diagpack {

// Short host name, "localhost" when the kernel reports none.
std::string LocalHostId();

// UTC time formatted as MM_DD_YYYY_HH_MM.
std::string FormatUtcStamp(std::time_t t);

// <hostId>_CollectedData_<MM_DD_YYYY_HH_MM>_UTC.zip
std::string ArchiveFileName(const std::string& host_id, std::time_t t);

} // namespace diagpack
