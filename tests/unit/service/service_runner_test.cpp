#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "ssg/foundation/config_manager.hpp"
#include "ssg/foundation/error_code.hpp"
#include "ssg/service/service_runner.hpp"

using namespace ssg::service;
using ssg::foundation::ConfigManager;
using ssg::foundation::ErrorCode;

namespace {

/// Mutable argv built from string literals.
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) {
            pointers.push_back(s.data());
        }
    }
    int argc() const { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

}  // namespace

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

TEST(ServiceRunnerArgsTest, ParseConfigArg) {
    Argv args({"ssg-admin", "--config", "/etc/ssg/ssg.yaml", "check-config"});
    EXPECT_EQ(parseConfigArg(args.argc(), args.argv()), "/etc/ssg/ssg.yaml");
}

TEST(ServiceRunnerArgsTest, MissingConfigArgIsEmpty) {
    Argv args({"ssg-admin", "gen-key"});
    EXPECT_TRUE(parseConfigArg(args.argc(), args.argv()).empty());

    Argv dangling({"ssg-admin", "--config"});
    EXPECT_TRUE(parseConfigArg(dangling.argc(), dangling.argv()).empty());
}

TEST(ServiceRunnerArgsTest, PositionalArgsSkipConfig) {
    Argv args({"ssg-admin", "--config", "a.yaml", "verify-password", "pw", "salt:hash"});
    auto positional = positionalArgs(args.argc(), args.argv());
    ASSERT_EQ(positional.size(), 3u);
    EXPECT_EQ(positional[0], "verify-password");
    EXPECT_EQ(positional[1], "pw");
    EXPECT_EQ(positional[2], "salt:hash");
}

// ---------------------------------------------------------------------------
// Config loading
// ---------------------------------------------------------------------------

class ServiceRunnerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(kConfigPathEnv);
        tmpDir_ = std::filesystem::temp_directory_path() / "ssg_runner_test";
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        unsetenv(kConfigPathEnv);
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) {
        auto path = tmpDir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ServiceRunnerConfigTest, LoadsDefaultPath) {
    auto path = write("default.yaml", "session:\n  cookie_name: from_default\n");
    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(config.getOr<std::string>("session.cookie_name", ""), "from_default");
}

TEST_F(ServiceRunnerConfigTest, EnvironmentOverridesPath) {
    auto fallback = write("default.yaml", "session:\n  cookie_name: from_default\n");
    auto fromEnv = write("env.yaml", "session:\n  cookie_name: from_env\n");
    setenv(kConfigPathEnv, fromEnv.c_str(), 1);

    EXPECT_TRUE(hasConfigSource({}));
    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, fallback).hasValue());
    EXPECT_EQ(config.getOr<std::string>("session.cookie_name", ""), "from_env");
}

TEST_F(ServiceRunnerConfigTest, NoSourceWithoutPathOrEnvironment) {
    EXPECT_FALSE(hasConfigSource({}));
    EXPECT_TRUE(hasConfigSource("ssg.yaml"));
}

TEST_F(ServiceRunnerConfigTest, MissingFileFails) {
    ConfigManager config;
    auto result = loadConfig(config, tmpDir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}
