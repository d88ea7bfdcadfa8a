#include <pgrails/database_config.h>
#include <pgrails/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace pgrails {
namespace {

using ::testing::HasSubstr;

TEST(StripErbTagsTest, RemovesOutputTagDelimiters) {
  EXPECT_EQ(StripErbTags("pool: <%= ENV.fetch(\"MAX\") { 5 } %>"),
            "pool:  ENV.fetch(\"MAX\") { 5 } ");
  EXPECT_EQ(StripErbTags("plain: value"), "plain: value");
}

TEST(ParseDatabaseConfigTest, KeepsMappingEnvironmentsInFileOrder) {
  const auto config = ParseDatabaseConfig(R"(
development:
  adapter: postgresql
  pool: 5
version: 3
production:
  adapter: postgresql
)",
                                          "database.yml");

  ASSERT_EQ(config.environments.size(), 2u);
  EXPECT_EQ(config.environments[0].name, "development");
  EXPECT_EQ(config.environments[1].name, "production");
  EXPECT_EQ(config.Find("development")->settings["pool"].as<int>(), 5);
  EXPECT_EQ(config.Find("version"), nullptr);
  EXPECT_EQ(config.Find("test"), nullptr);
}

TEST(ParseDatabaseConfigTest, ResolvesMergeKeysWithLocalValuesWinning) {
  const auto config = ParseDatabaseConfig(R"(
default: &default
  adapter: postgresql
  pool: 5
  variables:
    statement_timeout: 30000

production:
  <<: *default
  pool: 25
)",
                                          "database.yml");

  const auto *production = config.Find("production");
  ASSERT_NE(production, nullptr);
  EXPECT_EQ(production->settings["pool"].as<int>(), 25);
  EXPECT_EQ(production->settings["adapter"].as<std::string>(), "postgresql");
  EXPECT_EQ(
      production->settings["variables"]["statement_timeout"].as<int>(),
      30000);
  EXPECT_FALSE(production->settings["<<"].IsDefined());
}

TEST(ParseDatabaseConfigTest, ErbTemplatedValuesStillParse) {
  const auto config = ParseDatabaseConfig(
      "production:\n  database: <%= ENV['DATABASE_NAME'] %>\n",
      "database.yml");

  ASSERT_NE(config.Find("production"), nullptr);
  EXPECT_EQ(config.Find("production")->settings["database"].as<std::string>(),
            "ENV['DATABASE_NAME']");
}

TEST(ParseDatabaseConfigTest, MalformedYamlRaisesConfigParseError) {
  try {
    ParseDatabaseConfig("production: [unclosed\n", "config/database.yml");
    FAIL() << "expected ConfigParseError";
  } catch (const ConfigParseError &error) {
    EXPECT_THAT(error.what(), HasSubstr("config/database.yml"));
  }
}

TEST(ParseDatabaseConfigTest, NonMappingRootRaisesConfigParseError) {
  EXPECT_THROW(ParseDatabaseConfig("- development\n- production\n", "db.yml"),
               ConfigParseError);
}

TEST(LoadDatabaseConfigTest, MissingFileRaisesConfigFileMissing) {
  test::TemporaryProject project;
  EXPECT_THROW(LoadDatabaseConfig(project.root() / "config" / "database.yml"),
               ConfigFileMissing);
}

TEST(LoadDatabaseConfigTest, ReadsFileFromDisk) {
  test::TemporaryProject project;
  const auto path =
      project.AddFile("config/database.yml", "test:\n  pool: 2\n");

  const auto config = LoadDatabaseConfig(path);

  ASSERT_NE(config.Find("test"), nullptr);
  EXPECT_EQ(config.Find("test")->settings["pool"].as<int>(), 2);
}

} // namespace
} // namespace pgrails
