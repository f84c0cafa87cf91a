#include <gtest/gtest.h>

#include "app/cli.h"

#include <chrono>
#include <string>
#include <vector>

using namespace evx::app;
using evx::core::ErrorCategory;
using evx::core::TaskError;
using namespace std::chrono_literals;

TEST(CliTest, ParsesExportWithOptions) {
  auto parsed = parse_command_line({"export", "job-1", "--interval", "5", "--max-wait=120",
                                    "-o", "out.gz", "--no-download", "--fields",
                                    "a,b", "-v"});

  ASSERT_TRUE(parsed.is_ok()) << parsed.error().user_message;
  const CliOptions &options = parsed.value();
  EXPECT_EQ(options.command, Command::Export);
  EXPECT_EQ(options.target_id, "job-1");
  EXPECT_EQ(options.interval, std::optional<std::chrono::milliseconds>(5000ms));
  EXPECT_EQ(options.max_wait, std::optional<std::chrono::milliseconds>(120000ms));
  EXPECT_EQ(options.output, std::string("out.gz"));
  EXPECT_EQ(options.fields, std::string("a,b"));
  EXPECT_TRUE(options.no_download);
  EXPECT_TRUE(options.verbose);
}

TEST(CliTest, OptionsMayPrecedeTheCommand) {
  auto parsed = parse_command_line({"--api-host", "api.example.io", "status", "t-1"});

  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().command, Command::Status);
  EXPECT_EQ(parsed.value().target_id, "t-1");
  EXPECT_EQ(parsed.value().api_host, std::string("api.example.io"));
}

TEST(CliTest, HelpAndVersion) {
  EXPECT_EQ(parse_command_line({}).is_err(), true);
  EXPECT_EQ(parse_command_line({"--help"}).value().command, Command::Help);
  EXPECT_EQ(parse_command_line({"download", "-h"}).value().command, Command::Help);
  EXPECT_EQ(parse_command_line({"--version"}).value().command, Command::Version);
  EXPECT_EQ(version_text().rfind("event-export ", 0), 0u);
}

TEST(CliTest, UsageErrorsExitWithTwo) {
  const std::vector<std::vector<std::string>> bad = {
      {"export"},
      {"frobnicate", "x"},
      {"status", "t-1", "--bogus"},
      {"status", "t-1", "extra"},
      {"export", "j", "--interval"},
      {"export", "j", "--interval", "0"},
  };
  for (const auto &args : bad) {
    auto parsed = parse_command_line(args);
    ASSERT_TRUE(parsed.is_err()) << args.front();
    EXPECT_EQ(parsed.error().category, ErrorCategory::Config);
    EXPECT_EQ(exit_code_for(parsed.error()), 2);
  }
}

TEST(CliTest, OverridesReplaceEnvironmentValues) {
  evx::core::ExportConfig config;
  config.api_host = "env-host";
  config.s3_bucket = "env-bucket";
  config.s3_sse_c_key = "env-key";

  auto parsed = parse_command_line({"export", "j", "--s3-bucket", "cli-bucket",
                                    "--s3-sse-c-key", "cli-key", "--no-sse-c",
                                    "--fields", "x, y"});
  ASSERT_TRUE(parsed.is_ok());
  apply_overrides(parsed.value(), config);

  EXPECT_EQ(config.api_host, "env-host");
  EXPECT_EQ(config.s3_bucket, "cli-bucket");
  EXPECT_EQ(config.s3_sse_c_key, std::string("cli-key"));
  EXPECT_TRUE(config.no_sse_c);
  EXPECT_EQ(config.export_fields, (std::vector<std::string>{"x", "y"}));
}

TEST(CliTest, ExitCodes) {
  EXPECT_EQ(exit_code_for(TaskError::Config("x")), 2);
  EXPECT_EQ(exit_code_for(TaskError(ErrorCategory::InvalidKeyLength, 2, "x")), 2);
  EXPECT_EQ(exit_code_for(TaskError::Interrupted()), 130);
  EXPECT_EQ(exit_code_for(TaskError(ErrorCategory::PollTimeout, 1, "x")), 1);
  EXPECT_EQ(exit_code_for(TaskError(ErrorCategory::KeyRequired, 2, "x")), 1);
  EXPECT_EQ(exit_code_for(TaskError(ErrorCategory::DownloadFailed, 1, "x")), 1);
}

TEST(CliTest, FormatErrorNamesTaskAndElapsedTime) {
  TaskError error(ErrorCategory::PollTimeout, 1, false, "Timed out after 61.0s",
                  "max_wait exceeded", {{"task_id", "t-9"}, {"elapsed_s", "61.0"}});

  const std::string text = format_error(error);

  EXPECT_NE(text.find("Error: Timed out after 61.0s"), std::string::npos);
  EXPECT_NE(text.find("Task ID: t-9"), std::string::npos);
  EXPECT_NE(text.find("Elapsed: 61.0s"), std::string::npos);
}

TEST(CliTest, FormatErrorOffersManualDownloadUrl) {
  TaskError error(ErrorCategory::DownloadFailed, 1, false, "Connection reset", "recv",
                  {{"task_id", "t-9"},
                   {"result_location", "https://s3/x?sig=1"},
                   {"destination", "out.gz"},
                   {"bytes_written", "2048"}});

  const std::string text = format_error(error);

  EXPECT_NE(text.find("https://s3/x?sig=1"), std::string::npos);
  EXPECT_NE(text.find("Partial file kept: out.gz (2048 bytes)"), std::string::npos);
}

TEST(CliTest, FormatInterruptSuggestsStatusCommand) {
  TaskError error = TaskError::Interrupted();
  error.details["task_id"] = "t-9";

  EXPECT_NE(format_error(error).find("event-export status t-9"), std::string::npos);
}
