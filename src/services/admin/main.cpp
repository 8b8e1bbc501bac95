/// @file main.cpp
/// @brief ssg-admin entry point.
///
/// Operator tooling for the secure session gateway: key and MFA secret
/// generation, password hashing, TOTP inspection and configuration checks.

#include "ssg/foundation/config_manager.hpp"
#include "ssg/foundation/service_logger.hpp"
#include "ssg/service/auth_config.hpp"
#include "ssg/service/mfa_gate.hpp"
#include "ssg/service/password_hasher.hpp"
#include "ssg/service/service_runner.hpp"
#include "ssg/service/session_orchestrator.hpp"
#include "ssg/version.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

using ssg::service::AuthConfig;

void printUsage() {
    std::cerr << "ssg-admin " << ssg::Version::string << "\n"
              << "usage: ssg-admin [--config <path>] <command> [args]\n"
              << "  gen-key                          random 256-bit session key (hex)\n"
              << "  gen-mfa-secret                   random TOTP secret (base32)\n"
              << "  hash-password <password>         PBKDF2 hash as salt:derived\n"
              << "  verify-password <password> <stored>\n"
              << "  totp <secret>                    current TOTP code\n"
              << "  check-config                     validate the configuration\n";
}

int genKey() {
    auto hex = ssg::service::SessionKey::generateHex();
    if (!hex) {
        std::cerr << "failed: " << hex.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << hex.value() << "\n";
    return EXIT_SUCCESS;
}

int genMfaSecret() {
    auto secret = ssg::service::MfaGate::generateSecret();
    if (!secret) {
        std::cerr << "failed: " << secret.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << secret.value() << "\n";
    return EXIT_SUCCESS;
}

int hashPassword(const AuthConfig& cfg, const std::string& password) {
    ssg::service::PasswordHasher hasher(cfg.pbkdf2Iterations);
    auto hashed = hasher.hash(password);
    if (!hashed) {
        std::cerr << "failed: " << hashed.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << hashed.value().encoded() << "\n";
    return EXIT_SUCCESS;
}

int verifyPassword(const AuthConfig& cfg, const std::string& password, const std::string& stored) {
    ssg::service::PasswordHasher hasher(cfg.pbkdf2Iterations);
    bool ok = hasher.verify(password, stored);
    std::cout << (ok ? "match" : "mismatch") << "\n";
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int totp(const AuthConfig& cfg, const std::string& secret) {
    auto now = std::chrono::system_clock::now();
    auto code = ssg::service::MfaGate::totpCode(secret, now, cfg.totpStep);
    if (!code) {
        std::cerr << "invalid base32 secret\n";
        return EXIT_FAILURE;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    auto remaining = cfg.totpStep.count() - elapsed % cfg.totpStep.count();
    std::cout << *code << " (valid for " << remaining << "s)\n";
    return EXIT_SUCCESS;
}

int checkConfig(const AuthConfig& cfg) {
    auto key = ssg::service::loadSessionKey(cfg);
    if (!key) {
        std::cerr << "session key: " << key.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "rate_limit: " << cfg.rateLimitMaxAttempts << " per "
              << cfg.rateLimitWindow.count() << "s\n"
              << "pbkdf2_iterations: " << cfg.pbkdf2Iterations << "\n"
              << "mfa: clearance > " << ssg::service::MfaGate::kClearanceThreshold << ", step "
              << cfg.totpStep.count() << "s, skew " << cfg.totpSkewSteps << "\n"
              << "session: cookie '" << cfg.sessionCookieName << "', lifetime "
              << cfg.sessionLifetime.count() << "s, key "
              << (cfg.sessionKeyHex.empty() ? "generated per process" : "configured") << "\n"
              << "collaborator_timeout: " << cfg.collaboratorTimeout.count() << "ms\n"
              << "configuration OK\n";
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = ssg::service::positionalArgs(argc, argv);
    if (args.empty()) {
        printUsage();
        return EXIT_FAILURE;
    }

    ssg::foundation::ConfigManager config;
    auto configPath = ssg::service::parseConfigArg(argc, argv);
    if (ssg::service::hasConfigSource(configPath)) {
        auto loadResult = ssg::service::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto authConfig = ssg::service::authConfigFromConfig(config);
    if (!authConfig) {
        std::cerr << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& cfg = authConfig.value();

    const auto& command = args[0];
    int rc = EXIT_FAILURE;
    if (command == "gen-key" && args.size() == 1) {
        rc = genKey();
    } else if (command == "gen-mfa-secret" && args.size() == 1) {
        rc = genMfaSecret();
    } else if (command == "hash-password" && args.size() == 2) {
        rc = hashPassword(cfg, args[1]);
    } else if (command == "verify-password" && args.size() == 3) {
        rc = verifyPassword(cfg, args[1], args[2]);
    } else if (command == "totp" && args.size() == 2) {
        rc = totp(cfg, args[1]);
    } else if (command == "check-config" && args.size() == 1) {
        rc = checkConfig(cfg);
    } else {
        printUsage();
    }

    auto flushed = ssg::foundation::ServiceLogger::instance().flush();
    if (!flushed) {
        std::cerr << "log flush failed: " << flushed.error().message() << "\n";
    }
    return rc;
}
