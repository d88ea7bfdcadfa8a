#include <pgrails/text_extractor.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pgrails {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(SplitLinesTest, KeepsEmptyLinesAndStripsCarriageReturns) {
  EXPECT_THAT(SplitLines("a\r\n\nb"), ElementsAre("a", "", "b"));
  EXPECT_THAT(SplitLines(""), ElementsAre(""));
}

TEST(ExtractTableBlocksTest, FindsEachCreateTableBody) {
  const std::string schema = R"(ActiveRecord::Schema.define(version: 1) do
  create_table "users", force: :cascade do |t|
    t.string "email"
  end

  create_table "posts", force: :cascade do |t|
    t.bigint "user_id"
    t.string "title"
  end
end
)";

  const auto blocks = ExtractTableBlocks(schema);

  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0].name, "users");
  EXPECT_NE(blocks[0].body.find("t.string \"email\""), std::string::npos);
  EXPECT_EQ(blocks[0].body.find("user_id"), std::string::npos);
  EXPECT_EQ(blocks[1].name, "posts");
  EXPECT_NE(blocks[1].body.find("user_id"), std::string::npos);
}

TEST(ExtractTableBlocksTest, HandlesSingleLineBlocks) {
  const auto blocks =
      ExtractTableBlocks(R"(create_table "posts" do |t| t.integer "user_id" end)");

  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].name, "posts");
  EXPECT_THAT(ExtractColumns(blocks[0].body), ::testing::SizeIs(1));
}

TEST(ExtractTableBlocksTest, IgnoresEndInsideStringsCommentsAndWords) {
  const std::string schema = R"(create_table "events" do |t|
    t.string "legend", default: "the end"
    # end of the audit columns
    t.datetime "ends_at"
    t.boolean "is_pending"
  end)";

  const auto blocks = ExtractTableBlocks(schema);

  ASSERT_EQ(blocks.size(), 1u);
  const auto columns = ExtractColumns(blocks[0].body);
  ASSERT_EQ(columns.size(), 3u);
  EXPECT_EQ(columns[2].name, "is_pending");
}

TEST(ExtractTableBlocksTest, SkipsHeadersWithoutBlock) {
  const std::string schema = R"(create_table "broken"
create_table "users" do |t|
  t.string "name"
end)";

  const auto blocks = ExtractTableBlocks(schema);

  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].name, "users");
}

TEST(ExtractColumnsTest, ReturnsTypeAndNameInOrder) {
  const auto columns = ExtractColumns(R"(
    t.string "title", null: false
    t.bigint "author_id"
    t.timestamps
  )");

  ASSERT_EQ(columns.size(), 2u);
  EXPECT_EQ(columns[0].type, "string");
  EXPECT_EQ(columns[0].name, "title");
  EXPECT_EQ(columns[1].type, "bigint");
  EXPECT_EQ(columns[1].name, "author_id");
}

TEST(ExtractForeignKeyColumnsTest, KeepsOnlyIdSuffixedColumns) {
  const auto foreign_keys = ExtractForeignKeyColumns(R"(
    t.bigint "user_id"
    t.string "uuid"
    t.integer "category_id"
    t.string "identifier"
  )");

  EXPECT_THAT(foreign_keys, ElementsAre("user_id", "category_id"));
}

TEST(ExtractIndexDeclarationsTest, RecordsTableAndFirstColumn) {
  const auto indexes = ExtractIndexDeclarations(R"(
  add_index "posts", ["user_id", "created_at"], name: "idx"
  add_index "comments", "post_id"
)");

  ASSERT_EQ(indexes.size(), 2u);
  EXPECT_EQ(indexes[0].table, "posts");
  EXPECT_EQ(indexes[0].first_column, "user_id");
  EXPECT_EQ(indexes[1].table, "comments");
  EXPECT_EQ(indexes[1].first_column, "post_id");
}

TEST(ExtractInlineIndexColumnsTest, RecordsFirstColumn) {
  const auto columns = ExtractInlineIndexColumns(R"(
    t.index ["user_id", "created_at"], name: "index_posts_on_user_id"
    t.index "slug", unique: true
  )");

  EXPECT_THAT(columns, ElementsAre("user_id", "slug"));
}

TEST(ExtractWhereFiltersTest, FindsKeywordAndStringConditionsWithLines) {
  const std::string source = "class User < ApplicationRecord\n"
                             "  scope :active, -> { where(x: 1) }\n"
                             "  def self.recent\n"
                             "    User.where(status: 'open')\n"
                             "    User.where(\"created_at > ?\", 1.day.ago)\n"
                             "    User.where('email = ?', value)\n"
                             "  end\n"
                             "end\n";

  const auto filters = ExtractWhereFilters(source);

  ASSERT_EQ(filters.size(), 2u);
  EXPECT_EQ(filters[0].column, "status");
  EXPECT_EQ(filters[0].line, 4);
  EXPECT_EQ(filters[1].column, "email");
  EXPECT_EQ(filters[1].line, 6);
}

TEST(ExtractWhereFiltersTest, ReturnsNothingForPlainCode) {
  EXPECT_THAT(ExtractWhereFilters("def index\n  @users = User.all\nend\n"),
              IsEmpty());
}

TEST(LinePredicatesTest, RecognizesQueryFetches) {
  EXPECT_TRUE(IsQueryFetch("@posts = Post.all"));
  EXPECT_TRUE(IsQueryFetch("@post = Post.find(params[:id])"));
  EXPECT_TRUE(IsQueryFetch("@user = User.find_by(email: email)"));
  EXPECT_FALSE(IsQueryFetch("@count = Post.count"));
  EXPECT_FALSE(IsQueryFetch("@posts = Post.allowed"));
}

TEST(LinePredicatesTest, RecognizesEagerLoading) {
  EXPECT_TRUE(HasEagerLoading("Post.includes(:author)"));
  EXPECT_TRUE(HasEagerLoading("Post.preload(:comments)"));
  EXPECT_TRUE(HasEagerLoading("Post.eager_load(:tags)"));
  EXPECT_FALSE(HasEagerLoading("Post.joins(:author)"));
}

TEST(LinePredicatesTest, ExtractsAssignedInstanceVariable) {
  EXPECT_EQ(ExtractInstanceAssignment("  @posts = Post.all"),
            std::optional<std::string>("posts"));
  EXPECT_EQ(ExtractInstanceAssignment("posts = Post.all"), std::nullopt);
}

TEST(LinePredicatesTest, MatchesTwoLevelAccessOnTheVariableOnly) {
  EXPECT_TRUE(HasChainedMemberAccess("<%= @posts.first.author %>", "posts"));
  EXPECT_FALSE(HasChainedMemberAccess("@posts.each do |post|", "posts"));
  EXPECT_FALSE(HasChainedMemberAccess("@other.first.author", "posts"));
  EXPECT_FALSE(HasChainedMemberAccess("@posts.first.author", "po(sts"));
}

TEST(LinePredicatesTest, MatchesThreeSegmentChains) {
  EXPECT_TRUE(HasAssociationChain("<%= post.author.name %>"));
  EXPECT_FALSE(HasAssociationChain("<%= post.title %>"));
}

} // namespace
} // namespace pgrails
