#pragma once

#include "library/SortPolicy.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace po::config {

constexpr auto DEFAULT_CONFIG_PATH = "po.yaml";

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum po      = spdlog::level::info;  // Startup, per-run summary
    spdlog::level::level_enum library = spdlog::level::info;  // Index load/persist, every placed file
    spdlog::level::level_enum scan    = spdlog::level::info;  // Input directory enumeration
    spdlog::level::level_enum shell   = spdlog::level::warn;  // Argument parsing
    spdlog::level::level_enum config  = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::filesystem::path log_file; // empty: console only
};

struct Config {
    std::vector<std::filesystem::path> inputs; // searched non-recursively
    std::filesystem::path output;
    std::vector<std::string> extensions;       // without the dot; empty captures everything
    library::SortPolicy sort_policy = library::SortPolicy::MoveToRoot;

    LoggingConfig logging;

    [[nodiscard]] std::string toYaml() const;
};

/// Throws std::runtime_error naming path when the file cannot be read or a
/// value does not parse.
Config loadConfig(const std::filesystem::path& path);

Config parseConfig(const std::string& yaml);

/// Like spdlog::level::from_str, but throws on unknown names instead of
/// quietly mapping them to "off".
spdlog::level::level_enum parseLevel(const std::string& name);

} // namespace po::config
