#pragma once

#include "diagpack/util/logger.hpp"
#include "diagpack/util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace diagpack::config {

// Values read from the JSON configuration file. Every key is optional; unset
// members leave the built-in defaults (or CLI values) in place.
struct CollectorConfig {
    std::optional<std::string> staging_dir;
    std::optional<std::string> output_dir;
    std::optional<std::string> host_id;
    std::optional<std::string> shell_interpreter;
    std::optional<std::string> batch_interpreter;
    std::optional<std::string> report_path;
    std::optional<std::string> progress_file;
    std::optional<std::uint64_t> command_timeout_sec;
    std::optional<std::uint64_t> max_command_output_bytes;
    std::optional<std::vector<std::string>> registry_export_command;
    std::optional<LogLevel> log_level;
    std::optional<bool> progress;

    void Reset();
    Result LoadFile(const std::string& path);
};

} // namespace diagpack::config
