#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace pgrails {
namespace {

using ::testing::HasSubstr;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::current_path() / "pgrails-analyze";
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

std::string Quiet(const std::string &command) {
  return command + " > /dev/null 2>&1";
}

class CliIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.WithRailsMarker();
    project_.AddFile("db/schema.rb", R"(create_table "posts" do |t|
  t.bigint "user_id"
  t.boolean "published"
end
)");
    project_.AddFile("app/controllers/posts_controller.rb",
                     "class PostsController < ApplicationController\n"
                     "  def index\n"
                     "    @posts = Post.all\n"
                     "    @title = @posts.first.title\n"
                     "  end\n"
                     "end\n");
    project_.AddFile("config/database.yml",
                     "production:\n  adapter: postgresql\n  pool: 5\n");
    cli_ = ExecutableUnderTest();
    ASSERT_TRUE(std::filesystem::exists(cli_))
        << "Expected CLI executable at " << cli_;
  }

  std::string Command(const std::string &arguments) const {
    return cli_.string() + " " + arguments + " --root " +
           project_.root().string();
  }

  test::TemporaryProject project_;
  std::filesystem::path cli_;
};

TEST_F(CliIntegrationTest, IndexesWritesReportsAndSucceeds) {
  const auto out = project_.root() / "reports";

  ASSERT_EQ(ExitCode(Quiet(Command("indexes --format text,json --out " +
                                   out.string()))),
            0);

  const auto text = LoadFile(out / "pgrails_indexes.txt");
  EXPECT_THAT(text, HasSubstr("Table: posts, Column: user_id"));
  EXPECT_THAT(text, HasSubstr("add_index :posts, :user_id"));
  const auto json = LoadFile(out / "pgrails_indexes.json");
  EXPECT_THAT(json, HasSubstr("\"type\": \"missing_foreign_key_index\""));
}

TEST_F(CliIntegrationTest, NPlusOneFailsWhenWarningsExist) {
  EXPECT_EQ(ExitCode(Quiet(Command("n-plus-one"))), 1);
}

TEST_F(CliIntegrationTest, ConfigAlwaysSucceeds) {
  EXPECT_EQ(ExitCode(Quiet(Command("config"))), 0);
}

TEST_F(CliIntegrationTest, FatalErrorsExitWithOne) {
  std::filesystem::remove(project_.root() / "config" / "database.yml");

  EXPECT_EQ(ExitCode(Quiet(Command("config"))), 1);
  EXPECT_EQ(ExitCode(Quiet(Command("vacuum"))), 1);
  EXPECT_EQ(ExitCode(Quiet(Command("indexes --bogus"))), 1);
}

TEST_F(CliIntegrationTest, HelpExitsCleanly) {
  EXPECT_EQ(ExitCode(Quiet(cli_.string() + " --help")), 0);
  EXPECT_EQ(ExitCode(Quiet(cli_.string() + " indexes --help")), 0);
}

} // namespace
} // namespace pgrails
