#include "diagpack/util/collector_config.hpp"

#include "diagpack/util/config_json_utils.hpp"

namespace diagpack::config {

void CollectorConfig::Reset() {
    *this = CollectorConfig{};
}

Result CollectorConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(-1, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace diagpack::config
