#pragma once

#include "diagpack/collect/collection_result.hpp"
#include "diagpack/util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace diagpack {

// {
//   "outcome": "Success|Cancelled|Failed",
//   "cancelled": false,
//   "archive": "<path>" | null,
//   "sha256": "<hex>" | null,
//   "error": "<fatal error>" | null,
//   "packages": { "<id>": { "files": n, "registries": n, "eventLogs": n,
//                           "commands": n, "errors": [ {...} ] } }
// }
nlohmann::json ReportToJson(const CollectionResult& result);

// Written to "<path>.tmp" first, then renamed over `path`.
Result WriteReportFile(const CollectionResult& result, const std::string& path);

} // namespace diagpack
