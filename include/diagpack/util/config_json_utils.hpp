#pragma once

#include "diagpack/util/collector_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace diagpack::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, CollectorConfig& cfg, std::string& err);

} // namespace diagpack::config::detail
