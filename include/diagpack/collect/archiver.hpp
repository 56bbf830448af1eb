#pragma once

#include "diagpack/util/result.hpp"

#include <ctime>
#include <filesystem>
#include <functional>
#include <string>

namespace diagpack {

// Packs every regular file below the staging root into one deflate-compressed
// zip named <host>_CollectedData_<MM_DD_YYYY_HH_MM>_UTC.zip. Entry names are
// '/'-separated paths relative to the staging root; directories get no entry.
// An existing archive of the same name is never overwritten.
class Archiver {
  public:
    using Clock = std::function<std::time_t()>;

    explicit Archiver(std::string host_id, Clock clock = nullptr);

    Result Archive(const std::filesystem::path& staging_root,
                   const std::filesystem::path& destination_dir,
                   std::string& out_path) const;

  private:
    std::string host_id_;
    Clock clock_;
};

} // namespace diagpack
