/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "ssg/service/service_runner.hpp"

#include <cstdlib>
#include <string_view>

namespace ssg::service {

// -- Config loading ----------------------------------------------------------

ssg::foundation::ServiceResult<void>
loadConfig(ssg::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    // SSG_CONFIG_PATH wins over the default path.
    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

bool hasConfigSource(const std::filesystem::path& cliPath) {
    const char* envPath = std::getenv(kConfigPathEnv);
    return !cliPath.empty() || (envPath != nullptr && *envPath != '\0');
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::vector<std::string> positionalArgs(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            ++i;
            continue;
        }
        args.emplace_back(arg);
    }
    return args;
}

} // namespace ssg::service
