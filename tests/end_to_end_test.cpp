#include <pgrails/analyzer_pipeline_builder.h>
#include <pgrails/default_analyzer_pipeline.h>
#include <pgrails/logging.h>

#include <sstream>
#include <variant>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace pgrails {
namespace {

using ::testing::HasSubstr;
using ::testing::SizeIs;

constexpr char kSchema[] = R"(ActiveRecord::Schema[7.1].define(version: 2024_03_01_120000) do
  create_table "users", force: :cascade do |t|
    t.string "email", null: false
    t.boolean "is_admin", default: false
    t.boolean "active", default: true
  end

  create_table "posts", force: :cascade do |t|
    t.bigint "user_id", null: false
    t.bigint "category_id"
    t.string "title"
    t.boolean "published"
    t.index ["category_id"], name: "index_posts_on_category_id"
  end
end
)";

constexpr char kUserModel[] = R"(class User < ApplicationRecord
  has_many :posts
  def self.admins = User.where(is_admin: true)
  def self.by_email(email) = User.where(email: email)
end
)";

constexpr char kPostsController[] = R"(class PostsController < ApplicationController
  def index
    @posts = Post.where(published: true)
    @headline = @posts.first.title.upcase
  end

  def show
    @post = Post.includes(:user).find(params[:id])
  end
end
)";

constexpr char kDatabaseYml[] = R"(default: &default
  adapter: postgresql
  pool: <%= ENV.fetch("RAILS_MAX_THREADS") { 5 } %>

development:
  <<: *default
  database: blog_development

production:
  <<: *default
  pool: 40
  sslmode: require
  reaping_frequency: 60
)";

class EndToEndTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.WithRailsMarker();
    project_.AddFile("db/schema.rb", kSchema);
    project_.AddFile("app/models/user.rb", kUserModel);
    project_.AddFile("app/controllers/posts_controller.rb", kPostsController);
    project_.AddFile("app/views/posts/index.html.erb",
                     "<% @posts.each do |post| %>\n"
                     "  <%= post.user.email %>\n"
                     "<% end %>\n");
    project_.AddFile("config/database.yml", kDatabaseYml);
  }

  PipelineResult Run(AnalysisSuite suite,
                     std::vector<std::string> formats = {"text"}) {
    AnalyzerPipelineBuilder builder;
    builder.WithLogger(MakeLogger({LogLevel::kDebug}, log_)).WithSuite(suite);
    auto pipeline = builder.Build();

    AnalysisConfig config;
    config.root_path = (project_.root() / "app" / "models").string();
    config.suite = suite;
    config.formats = std::move(formats);
    return pipeline.Run(config);
  }

  test::TemporaryProject project_;
  std::stringstream log_;
};

TEST_F(EndToEndTest, IndexesSuiteFindsSchemaAndWhereClauseIssues) {
  const auto result = Run(AnalysisSuite::kIndexes);

  EXPECT_EQ(result.summary.table_count, 2u);
  const auto *foreign_keys =
      result.findings.Find(FindingType::kMissingForeignKeyIndex);
  ASSERT_NE(foreign_keys, nullptr);
  ASSERT_THAT(foreign_keys->warnings, SizeIs(1));
  EXPECT_EQ(foreign_keys->warnings[0].LocationLabel(),
            "Table: posts, Column: user_id");
  EXPECT_EQ(*foreign_keys->warnings[0].suggestion,
            "add_index :posts, :user_id");

  const auto *booleans =
      result.findings.Find(FindingType::kBooleanIndexOpportunity);
  ASSERT_NE(booleans, nullptr);
  EXPECT_EQ(booleans->Count(), 3u);

  const auto *where = result.findings.Find(FindingType::kWhereClauseColumn);
  ASSERT_NE(where, nullptr);
  EXPECT_EQ(where->Count(), 3u);

  EXPECT_EQ(result.findings.Find(FindingType::kPotentialNPlusOne), nullptr);
  EXPECT_THAT(result.report.text, HasSubstr("Found 2 tables"));
  EXPECT_THAT(log_.str(), HasSubstr("pipeline.complete"));
}

TEST_F(EndToEndTest, NPlusOneSuiteFlagsControllerAndView) {
  const auto result = Run(AnalysisSuite::kNPlusOne);

  const auto *n_plus_one =
      result.findings.Find(FindingType::kPotentialNPlusOne);
  ASSERT_NE(n_plus_one, nullptr);
  ASSERT_THAT(n_plus_one->warnings, SizeIs(1));
  EXPECT_EQ(n_plus_one->warnings[0].LocationLabel(),
            "app/controllers/posts_controller.rb:3");

  const auto *views = result.findings.Find(FindingType::kViewAssociationAccess);
  ASSERT_NE(views, nullptr);
  EXPECT_EQ(views->Count(), 1u);
  EXPECT_EQ(result.summary.files_scanned, 2u);
  EXPECT_EQ(result.summary.table_count, 0u);
}

TEST_F(EndToEndTest, ConfigSuiteInspectsEachEnvironment) {
  const auto result = Run(AnalysisSuite::kConfig);

  const auto *pool = result.findings.Find(FindingType::kConnectionPoolSize);
  ASSERT_NE(pool, nullptr);
  ASSERT_THAT(pool->infos, SizeIs(1));
  EXPECT_EQ(pool->infos[0].LocationLabel(), "[production] pool");
  EXPECT_EQ(result.findings.Find(FindingType::kSslConfiguration), nullptr);
  EXPECT_EQ(result.findings.Find(FindingType::kReapingFrequency), nullptr);
  EXPECT_NE(result.findings.Find(FindingType::kPerformanceExtension), nullptr);
  EXPECT_THAT(result.report.text, HasSubstr("High Performance PostgreSQL"));
}

TEST_F(EndToEndTest, RepeatedRunsProduceIdenticalFindings) {
  const auto first = Run(AnalysisSuite::kIndexes, {"json"});
  const auto second = Run(AnalysisSuite::kIndexes, {"json"});

  EXPECT_EQ(first.findings.total, second.findings.total);
  EXPECT_EQ(first.report.json, second.report.json);
  for (std::size_t i = 0; i < first.findings.groups.size(); ++i) {
    EXPECT_EQ(first.findings.groups[i].All(), second.findings.groups[i].All());
  }
}

TEST(EndToEndSingleLineTest, ReportsPostsUserIdFromOneLineSchema) {
  test::TemporaryProject project;
  project.WithRailsMarker();
  project.AddFile("db/schema.rb",
                  R"(create_table "posts" do |t| t.integer "user_id" end)");

  AnalyzerPipelineBuilder builder;
  builder.WithRuleNames({"missing-foreign-key-index"});
  auto pipeline = builder.Build();
  AnalysisConfig config;
  config.root_path = project.root().string();
  const auto result = pipeline.Run(config);

  ASSERT_EQ(result.findings.total, 1u);
  const auto &finding = result.findings.groups[0].warnings[0];
  EXPECT_EQ(finding.message, "Foreign key user_id on posts should have an index");
  EXPECT_EQ(*finding.suggestion, "add_index :posts, :user_id");
}

} // namespace
} // namespace pgrails
