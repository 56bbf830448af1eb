#pragma once

#include "diagpack/util/result.hpp"

#include <string>

namespace diagpack {

// Lowercase hex SHA-256 of a regular file, read in 64 KiB chunks.
Result Sha256HexFile(const std::string& path, std::string& out_hex);

} // namespace diagpack
