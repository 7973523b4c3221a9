/// @file cli_options_test.cpp
/// @brief Tests for command-line overrides and exit codes

#include <gtest/gtest.h>

#include <cstdlib>

#include "cli/cli_options.h"
#include "common/config.h"
#include "common/error.h"
#include "test_helpers.h"

namespace driftscope::cli {
namespace {

TEST(ExitCodeTest, ArgumentAndConfigurationErrorsExitTwo) {
    EXPECT_EQ(ExitCodeFor(MakeError(ErrorCode::kInvalidArgument, "bad")), kExitInvalidArgument);
    EXPECT_EQ(ExitCodeFor(ValidationError("threshold")), kExitInvalidArgument);
    EXPECT_EQ(ExitCodeFor(MakeError(ErrorCode::kConfigurationError, "yaml")),
              kExitInvalidArgument);
    EXPECT_EQ(ExitCodeFor(absl::InvalidArgumentError("Unknown log level: loud")),
              kExitInvalidArgument);
}

TEST(ExitCodeTest, MissingInputExitsThree) {
    EXPECT_EQ(ExitCodeFor(InputNotFoundError("reference.csv")), kExitInputNotFound);
}

TEST(ExitCodeTest, WriteFailureExitsFive) {
    EXPECT_EQ(ExitCodeFor(WriteFailureError("reports")), kExitWriteFailure);
}

TEST(ExitCodeTest, LoadFailuresExitFour) {
    EXPECT_EQ(ExitCodeFor(MakeError(ErrorCode::kDeserializationError, "malformed CSV")),
              kExitLoadFailure);
    EXPECT_EQ(ExitCodeFor(absl::DataLossError("truncated")), kExitLoadFailure);
    EXPECT_EQ(ExitCodeFor(absl::InternalError("boom")), kExitLoadFailure);
    EXPECT_EQ(ExitCodeFor(absl::NotFoundError("config")), kExitLoadFailure);
}

TEST(ApplyOverridesTest, UnsetOverridesLeaveConfigUntouched) {
    auto config = Config::LoadFromString("drift:\n  threshold: 0.01\n  parallel: true\n");
    ASSERT_TRUE(config.ok());

    ApplyOverrides(CliOverrides{}, *config);

    EXPECT_DOUBLE_EQ(config->GetDouble("drift.threshold"), 0.01);
    EXPECT_TRUE(config->GetBool("drift.parallel"));
    EXPECT_FALSE(config->HasKey("drift.output_directory"));
    EXPECT_FALSE(config->HasKey("drift.render_chart"));
    EXPECT_FALSE(config->HasKey("drift.write_report"));
}

TEST(ApplyOverridesTest, FlagsWriteEveryKey) {
    CliOverrides overrides;
    overrides.threshold = 0.2;
    overrides.output_dir = "/tmp/reports";
    overrides.excluded_columns = {"Exited", "RowNumber"};
    overrides.log_level = "debug";
    overrides.chart = true;
    overrides.no_write = true;
    overrides.sequential = true;

    Config config;
    ApplyOverrides(overrides, config);

    EXPECT_DOUBLE_EQ(config.GetDouble("drift.threshold"), 0.2);
    EXPECT_EQ(config.GetString("drift.output_directory"), "/tmp/reports");
    EXPECT_EQ(config.GetStringList("drift.excluded_columns"),
              (std::vector<std::string>{"Exited", "RowNumber"}));
    EXPECT_EQ(config.GetString("logging.level"), "debug");
    EXPECT_TRUE(config.GetBool("drift.render_chart"));
    EXPECT_FALSE(config.GetBool("drift.write_report", true));
    EXPECT_FALSE(config.GetBool("drift.parallel", true));
}

class OverridePrecedenceTest : public driftscope::testing::TempDirTest {
protected:
    void TearDown() override {
        ::unsetenv("DRIFTSCOPE_CLI_TEST_THRESHOLD");
        ::unsetenv("DRIFTSCOPE_CLI_TEST_OUTPUT_DIRECTORY");
        TempDirTest::TearDown();
    }
};

TEST_F(OverridePrecedenceTest, FlagBeatsEnvironmentBeatsFile) {
    const auto file = WriteFile("driftscope.yaml",
                                "drift:\n"
                                "  threshold: 0.01\n"
                                "  output_directory: /from/file\n"
                                "  worker_threads: 3\n");
    ::setenv("DRIFTSCOPE_CLI_TEST_THRESHOLD", "0.1", 1);
    ::setenv("DRIFTSCOPE_CLI_TEST_OUTPUT_DIRECTORY", "/from/env", 1);

    auto config = LoadConfig(file, "DRIFTSCOPE_CLI_TEST_");
    ASSERT_TRUE(config.ok()) << config.status().message();

    // Environment over file
    EXPECT_DOUBLE_EQ(config->GetDouble("drift.threshold"), 0.1);
    EXPECT_EQ(config->GetString("drift.output_directory"), "/from/env");
    EXPECT_EQ(config->GetInt("drift.worker_threads"), 3);

    CliOverrides overrides;
    overrides.threshold = 0.2;
    ApplyOverrides(overrides, *config);

    // Flag over environment; keys without a flag keep the environment value
    EXPECT_DOUBLE_EQ(config->GetDouble("drift.threshold"), 0.2);
    EXPECT_EQ(config->GetString("drift.output_directory"), "/from/env");
    EXPECT_EQ(config->GetInt("drift.worker_threads"), 3);
}

TEST(LogConfigFromConfigTest, DefaultsToInfoOnConsole) {
    auto log_config = LogConfigFromConfig(Config{});
    ASSERT_TRUE(log_config.ok());
    EXPECT_EQ(log_config->level, LogLevel::kInfo);
    EXPECT_FALSE(log_config->enable_file);
}

TEST(LogConfigFromConfigTest, FileAndLevelFromConfig) {
    auto config = Config::LoadFromString("logging:\n  level: warning\n  file: /tmp/ds.log\n");
    ASSERT_TRUE(config.ok());

    auto log_config = LogConfigFromConfig(*config);
    ASSERT_TRUE(log_config.ok());
    EXPECT_EQ(log_config->level, LogLevel::kWarn);
    EXPECT_TRUE(log_config->enable_file);
    EXPECT_EQ(log_config->file_path, "/tmp/ds.log");
}

TEST(LogConfigFromConfigTest, UnknownLevelExitsTwo) {
    CliOverrides overrides;
    overrides.log_level = "loud";
    Config config;
    ApplyOverrides(overrides, config);

    auto log_config = LogConfigFromConfig(config);
    ASSERT_FALSE(log_config.ok());
    EXPECT_EQ(ExitCodeFor(log_config.status()), kExitInvalidArgument);
}

}  // namespace
}  // namespace driftscope::cli
