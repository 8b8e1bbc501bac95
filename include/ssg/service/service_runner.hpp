#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for gateway entry points.
///
/// Configuration path resolution and loading, and CLI argument parsing for
/// the SSG executables.

#include <filesystem>
#include <string>
#include <vector>

#include "ssg/foundation/config_manager.hpp"
#include "ssg/foundation/service_result.hpp"

namespace ssg::service {

/// Environment variable that overrides the configuration file path.
inline constexpr const char* kConfigPathEnv = "SSG_CONFIG_PATH";

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. SSG_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @param config      ConfigManager to populate.
/// @param defaultPath Fallback config file path.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] ssg::foundation::ServiceResult<void>
loadConfig(ssg::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// True when a configuration source is available: either @p cliPath is
/// non-empty or SSG_CONFIG_PATH is set.
[[nodiscard]] bool hasConfigSource(const std::filesystem::path& cliPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Positional arguments with `--config <path>` and argv[0] removed.
[[nodiscard]] std::vector<std::string>
positionalArgs(int argc, char* argv[]);

} // namespace ssg::service
