#include "diagpack/util/config_json_utils.hpp"

#include <fstream>

namespace diagpack::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j,
                      const char* key,
                      std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::optional<std::vector<std::string>>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array() || it->empty()) {
        err = std::string(key) + " must be a non-empty array of strings";
        return false;
    }
    std::vector<std::string> values;
    values.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be a non-empty array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, CollectorConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "StagingDir", cfg.staging_dir, err) ||
        !GetStringIfPresent(j, "OutputDir", cfg.output_dir, err) ||
        !GetStringIfPresent(j, "HostId", cfg.host_id, err) ||
        !GetStringIfPresent(j, "ShellInterpreter", cfg.shell_interpreter, err) ||
        !GetStringIfPresent(j, "BatchInterpreter", cfg.batch_interpreter, err) ||
        !GetStringIfPresent(j, "ReportPath", cfg.report_path, err) ||
        !GetStringIfPresent(j, "ProgressFile", cfg.progress_file, err) ||
        !GetU64IfPresent(j, "CommandTimeoutSec", cfg.command_timeout_sec, err) ||
        !GetU64IfPresent(j, "MaxCommandOutputBytes", cfg.max_command_output_bytes, err) ||
        !GetStringArrayIfPresent(j, "RegistryExportCommand", cfg.registry_export_command, err) ||
        !GetBoolIfPresent(j, "Progress", cfg.progress, err)) {
        return false;
    }

    if (cfg.command_timeout_sec.has_value() && *cfg.command_timeout_sec == 0) {
        err = "CommandTimeoutSec must be greater than zero";
        return false;
    }
    if (cfg.max_command_output_bytes.has_value() && *cfg.max_command_output_bytes == 0) {
        err = "MaxCommandOutputBytes must be greater than zero";
        return false;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level, err))
        return false;
    if (level.has_value()) {
        cfg.log_level = ParseLogLevel(*level);
        if (!cfg.log_level.has_value()) {
            err = "unknown LogLevel: " + *level;
            return false;
        }
    }

    if (cfg.registry_export_command.has_value()) {
        bool has_output = false;
        for (const auto& arg : *cfg.registry_export_command) {
            if (arg.find("{output}") != std::string::npos)
                has_output = true;
        }
        if (!has_output) {
            err = "RegistryExportCommand must reference {output}";
            return false;
        }
    }

    return true;
}

} // namespace diagpack::config::detail
