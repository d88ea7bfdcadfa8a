#include <pgrails/errors.h>
#include <pgrails/pgrails_cli.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace pgrails {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ParseSuiteTest, AcceptsTheThreeCommands) {
  EXPECT_EQ(ParseSuite("indexes"), AnalysisSuite::kIndexes);
  EXPECT_EQ(ParseSuite("n-plus-one"), AnalysisSuite::kNPlusOne);
  EXPECT_EQ(ParseSuite("config"), AnalysisSuite::kConfig);
  EXPECT_THROW(ParseSuite("analyze"), std::invalid_argument);
}

TEST(ParseAnalyzeArgumentsTest, ParsesFlagsAndValues) {
  const std::vector<std::string> args = {
      "--root",   "/srv/blog",       "--format", "text,JSON",
      "--out",    "reports",         "--config", "pgrails.yml",
      "--rules",  "timeouts, connection-pool", "--reporter", "text",
      "--debug"};

  const auto options = ParseAnalyzeArguments(args);

  ASSERT_TRUE(options.root);
  EXPECT_EQ(options.root->generic_string(), "/srv/blog");
  ASSERT_TRUE(options.output_directory);
  EXPECT_EQ(options.output_directory->generic_string(), "reports");
  ASSERT_TRUE(options.config_file);
  EXPECT_EQ(options.config_file->generic_string(), "pgrails.yml");
  EXPECT_THAT(options.formats, ElementsAre("text", "json"));
  EXPECT_THAT(options.rules, ElementsAre("timeouts", "connection-pool"));
  EXPECT_EQ(options.reporter, std::optional<std::string>("text"));
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kDebug));
}

TEST(ParseAnalyzeArgumentsTest, RejectsUnknownFlagsAndFormats) {
  EXPECT_THROW(ParseAnalyzeArguments({"--build", "out"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--format", "markdown"}),
               std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--root"}), std::invalid_argument);
}

TEST(ParseAnalyzeArgumentsTest, HelpStopsParsing) {
  const auto options = ParseAnalyzeArguments({"--help", "--bogus"});
  EXPECT_TRUE(options.show_help);
}

TEST(ParseConfigFileTest, ParsesYamlValues) {
  test::TemporaryProject project;
  const auto path = project.AddFile("pgrails.yml", R"(root: /from/yaml
out: reports
formats:
  - text
  - json
log-level: info
rules: [missing-foreign-key-index, where-clause-column]
reporter: text
boolean_preview_limit: 3
where_preview_limit: 0
)");

  const auto options = ParseConfigFile(path);

  ASSERT_TRUE(options.root);
  EXPECT_EQ(options.root->generic_string(), "/from/yaml");
  EXPECT_EQ(options.output_directory->generic_string(), "reports");
  EXPECT_THAT(options.formats, ElementsAre("text", "json"));
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kInfo));
  EXPECT_THAT(options.rules,
              ElementsAre("missing-foreign-key-index", "where-clause-column"));
  EXPECT_EQ(options.boolean_preview_limit, std::optional<std::size_t>(3));
  EXPECT_EQ(options.where_preview_limit, std::optional<std::size_t>(0));
}

TEST(ParseConfigFileTest, RejectsUnknownKeysAndBadValues) {
  test::TemporaryProject project;

  EXPECT_THROW(ParseConfigFile(project.AddFile("a.yml", "unexpected: 1\n")),
               std::invalid_argument);
  EXPECT_THROW(
      ParseConfigFile(project.AddFile("b.yml", "boolean_preview_limit: -2\n")),
      std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("c.toml", "root = 1\n")),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("d.yml", "root: [oops\n")),
               ConfigParseError);
  EXPECT_THROW(ParseConfigFile(project.root() / "missing.yml"),
               std::runtime_error);
}

TEST(ParseConfigFileTest, AcceptsOnlyDocumentedKeySpellings) {
  test::TemporaryProject project;

  const auto options = ParseConfigFile(project.AddFile(
      "spelled.yml", "Log-Level: debug\nWHERE-preview-limit: 2\n"));
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kDebug));
  EXPECT_EQ(options.where_preview_limit, std::optional<std::size_t>(2));

  EXPECT_THROW(
      ParseConfigFile(project.AddFile("a.yml", "output_directory: reports\n")),
      std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("b.yml", "output: reports\n")),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("c.yml", "format: json\n")),
               std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(project.AddFile("d.yml", "rule: timeouts\n")),
               std::invalid_argument);
}

TEST(ResolveAnalyzeOptionsTest, CliOverridesConfig) {
  test::TemporaryProject project;
  const auto path = project.AddFile("pgrails.yml", "root: /from/config\n"
                                                   "formats: json\n"
                                                   "rules: timeouts\n");

  AnalyzeOptions cli;
  cli.config_file = path;
  cli.root = "/from/cli";

  const auto merged = ResolveAnalyzeOptions(cli);

  EXPECT_EQ(merged.root->generic_string(), "/from/cli");
  EXPECT_THAT(merged.formats, ElementsAre("json"));
  EXPECT_THAT(merged.rules, ElementsAre("timeouts"));
}

TEST(ResolveAnalyzeOptionsTest, DefaultsRootToCurrentDirectory) {
  const auto merged = ResolveAnalyzeOptions(AnalyzeOptions{});
  ASSERT_TRUE(merged.root);
  EXPECT_EQ(*merged.root, std::filesystem::current_path());
}

TEST(BuildAnalysisConfigTest, AppliesDefaultsAndLimits) {
  AnalyzeOptions options;
  options.root = "/srv/blog";
  options.where_preview_limit = 4;

  const auto config = BuildAnalysisConfig(options, AnalysisSuite::kConfig);

  EXPECT_EQ(config.root_path, "/srv/blog");
  EXPECT_EQ(config.suite, AnalysisSuite::kConfig);
  EXPECT_THAT(config.formats, ElementsAre("text"));
  EXPECT_EQ(config.limits.boolean_preview, 5u);
  EXPECT_EQ(config.limits.where_column_preview, 4u);
}

TEST(RunCommandTest, WritesReportFilesAndReturnsExitCode) {
  test::TemporaryProject project;
  project.WithRailsMarker();
  project.AddFile("app/controllers/posts_controller.rb",
                  "class PostsController < ApplicationController\n"
                  "  def index\n"
                  "    @posts = Post.all\n"
                  "    @author = @posts.first.author\n"
                  "  end\n"
                  "end\n");
  const auto out = project.root() / "reports";

  testing::internal::CaptureStdout();
  const auto exit_code = RunCommand(
      AnalysisSuite::kNPlusOne,
      {"--root", project.root().string(), "--format", "text,json", "--out",
       out.string()});
  const auto stdout_text = testing::internal::GetCapturedStdout();

  EXPECT_EQ(exit_code, 1);
  EXPECT_THAT(stdout_text, HasSubstr("POTENTIAL N+1 QUERIES"));
  EXPECT_TRUE(std::filesystem::exists(out / "pgrails_n-plus-one.txt"));
  EXPECT_TRUE(std::filesystem::exists(out / "pgrails_n-plus-one.json"));
}

TEST(RunCommandTest, MissingSchemaIsFatal) {
  test::TemporaryProject project;
  project.WithRailsMarker();

  EXPECT_THROW(RunCommand(AnalysisSuite::kIndexes,
                          {"--root", project.root().string()}),
               SchemaFileMissing);
}

} // namespace
} // namespace pgrails
