// EN: Unit tests for ExecutorConfig (YAML loading, environment overrides, validation)
// FR: Tests unitaires pour ExecutorConfig (chargement YAML, surcharges d'environnement, validation)

#include <gtest/gtest.h>
#include "../include/infrastructure/config/executor_config.hpp"

#include <cstdlib>

using namespace DRX;

class ExecutorConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    void TearDown() override {
        for (const char* name : {"DRXTEST_ENGINE_BINARY", "DRXTEST_VOLUME_NAME", "DRXTEST_COMMAND_TIMEOUT_SECONDS",
                                 "DRXTEST_LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ExecutorConfigTest, Defaults) {
    ExecutorConfig config;
    EXPECT_EQ(config.getEngineBinary(), "docker");
    EXPECT_EQ(config.getVolumeName(), "dadosjusbr");
    EXPECT_EQ(config.getOutputDirName(), "output");
    EXPECT_EQ(config.getContainerOutputPath(), "/output");
    EXPECT_EQ(config.getCommandTimeoutSeconds(), 0);
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_TRUE(config.getLogFile().empty());

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ExecutorConfigTest, LoadsExecutorSection) {
    ExecutorConfig config;
    ASSERT_TRUE(config.loadFromString(R"(
executor:
  engine_binary: podman
  volume_name: shared
  command_timeout_seconds: 600
  log_level: debug
  log_file: /tmp/drx.log
)"));

    EXPECT_EQ(config.getEngineBinary(), "podman");
    EXPECT_EQ(config.getVolumeName(), "shared");
    EXPECT_EQ(config.getCommandTimeoutSeconds(), 600);
    EXPECT_EQ(config.getLogLevel(), "debug");
    EXPECT_EQ(config.getLogFile(), "/tmp/drx.log");
    EXPECT_EQ(config.getOutputDirName(), "output");
    EXPECT_EQ(config.parseLogLevel(), LogLevel::DEBUG);
}

TEST_F(ExecutorConfigTest, MissingSectionKeepsDefaults) {
    ExecutorConfig config;
    EXPECT_TRUE(config.loadFromString("other:\n  key: value\n"));
    EXPECT_TRUE(config.loadFromString(""));
    EXPECT_EQ(config.getEngineBinary(), "docker");
}

TEST_F(ExecutorConfigTest, RejectsInvalidYaml) {
    ExecutorConfig config;
    EXPECT_FALSE(config.loadFromString("executor: [broken"));
    EXPECT_FALSE(config.loadFromString("executor: scalar"));
    EXPECT_FALSE(config.loadFromString("executor:\n  engine_binary: podman\n  command_timeout_seconds: soon\n"));
    EXPECT_EQ(config.getEngineBinary(), "docker");
    EXPECT_FALSE(config.loadFromFile("/nonexistent/drx.yaml"));
}

TEST_F(ExecutorConfigTest, EnvironmentOverrides) {
    ::setenv("DRXTEST_ENGINE_BINARY", "nerdctl", 1);
    ::setenv("DRXTEST_VOLUME_NAME", "vol", 1);
    ::setenv("DRXTEST_COMMAND_TIMEOUT_SECONDS", "45", 1);

    ExecutorConfig config;
    EXPECT_TRUE(config.loadEnvironmentOverrides("DRXTEST_"));

    EXPECT_EQ(config.getEngineBinary(), "nerdctl");
    EXPECT_EQ(config.getVolumeName(), "vol");
    EXPECT_EQ(config.getCommandTimeoutSeconds(), 45);
}

TEST_F(ExecutorConfigTest, InvalidTimeoutOverride) {
    ::setenv("DRXTEST_COMMAND_TIMEOUT_SECONDS", "45s", 1);

    ExecutorConfig config;
    EXPECT_FALSE(config.loadEnvironmentOverrides("DRXTEST_"));
    EXPECT_EQ(config.getCommandTimeoutSeconds(), 0);
}

TEST_F(ExecutorConfigTest, ValidationCollectsErrors) {
    ExecutorConfig config;
    config.setEngineBinary("");
    config.setOutputDirName("a/b");
    config.setContainerOutputPath("output");
    config.setCommandTimeoutSeconds(-1);
    config.setLogLevel("verbose");

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 5u);
    EXPECT_THROW(config.parseLogLevel(), std::invalid_argument);
}

TEST_F(ExecutorConfigTest, ParseLogLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(ExecutorConfig::parseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(ExecutorConfig::parseLogLevel("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(ExecutorConfig::parseLogLevel("trace", level));
}
