#pragma once

#include "diagpack/manifest/manifest.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace diagpack {

// Parses the collection manifest (Packages -> Files/Registries/EventLogs/Commands).
// The error string is the manifest error reported to the caller; it is returned
// for markup that is not well formed and for command types that cannot be mapped.
// A document without any Package element parses to an empty Manifest.
class ManifestParser {
  public:
    std::expected<Manifest, std::string> Parse(std::string_view markup) const;
};

} // namespace diagpack
