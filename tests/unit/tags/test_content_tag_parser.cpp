#include <gtest/gtest.h>

#include "cardlink/tags/content_tag_parser.hpp"

using namespace cardlink::tags;

namespace {

std::vector<std::string> names(std::string_view content) {
  std::vector<std::string> result;
  for (const auto& tag : ContentTagParser::parse(content)) {
    result.push_back(tag.name);
  }
  return result;
}

}  // namespace

class ContentTagParserTest : public ::testing::Test {};

TEST_F(ContentTagParserTest, SimpleTag) {
  EXPECT_EQ(names("这是一个 #标签 测试"), std::vector<std::string>{"标签"});
}

TEST_F(ContentTagParserTest, MultipleTags) {
  EXPECT_EQ(names("#tag1 和 #tag2 以及 #tag3"),
            (std::vector<std::string>{"tag1", "tag2", "tag3"}));
}

TEST_F(ContentTagParserTest, NestedTagWithSlash) {
  EXPECT_EQ(names("#src/core/reactivity"), std::vector<std::string>{"src/core/reactivity"});
}

TEST_F(ContentTagParserTest, HeadingsAreNotTags) {
  EXPECT_TRUE(names("# 这是标题").empty());
  EXPECT_TRUE(names("## 二级标题\n### 三级标题").empty());
  EXPECT_TRUE(names("   # indented heading").empty());
}

TEST_F(ContentTagParserTest, TagAtLineStart) {
  EXPECT_EQ(names("#mytag 开始"), std::vector<std::string>{"mytag"});
  EXPECT_EQ(names("第一行\n#tag 第二行"), std::vector<std::string>{"tag"});
}

TEST_F(ContentTagParserTest, HashInsideWordIsNotATag) {
  EXPECT_TRUE(names("C#语言").empty());
  EXPECT_TRUE(names("issue#12").empty());
}

TEST_F(ContentTagParserTest, MixedContent) {
  std::string content =
      "# 标题\n"
      "\n"
      "这是正文 #标签1\n"
      "\n"
      "## 二级标题\n"
      "内容 #标签2 更多 #嵌套/标签";

  EXPECT_EQ(names(content), (std::vector<std::string>{"标签1", "标签2", "嵌套/标签"}));
}

TEST_F(ContentTagParserTest, Positions) {
  std::string content = "测试 #tag 文字";
  auto tags = ContentTagParser::parse(content);

  ASSERT_EQ(tags.size(), 1u);
  EXPECT_EQ(content.substr(tags[0].start, tags[0].end - tags[0].start), "#tag");
}

TEST_F(ContentTagParserTest, PositionsOnLaterLines) {
  std::string content = "line one\nsecond #two";
  auto tags = ContentTagParser::parse(content);

  ASSERT_EQ(tags.size(), 1u);
  EXPECT_EQ(tags[0].start, content.find('#'));
  EXPECT_EQ(tags[0].end, content.size());
}

TEST_F(ContentTagParserTest, CodeIsSkipped) {
  EXPECT_EQ(names("```\n#codeTag\n```\n正常 #normalTag"), std::vector<std::string>{"normalTag"});
  EXPECT_EQ(names("这是 `#inlineCode` 和正常的 #tag"), std::vector<std::string>{"tag"});
}

TEST_F(ContentTagParserTest, NameStopsAtBrackets) {
  EXPECT_EQ(names("#todo(soon) #a[b] #x{y}"), (std::vector<std::string>{"todo", "a", "x"}));
}

TEST_F(ContentTagParserTest, LoneHashIsNothing) {
  EXPECT_TRUE(names("a # b #").empty());
}

TEST_F(ContentTagParserTest, UnicodeWhitespaceSeparates) {
  // U+3000 ideographic space
  EXPECT_EQ(names("前　#tag　后"), std::vector<std::string>{"tag"});
}

TEST_F(ContentTagParserTest, UniqueNames) {
  EXPECT_EQ(ContentTagParser::uniqueNames("#tag1 #tag2 #tag1 #tag3"),
            (std::vector<std::string>{"tag1", "tag2", "tag3"}));
  EXPECT_TRUE(ContentTagParser::uniqueNames("# 这是标题").empty());
}

TEST_F(ContentTagParserTest, ValidNames) {
  EXPECT_TRUE(ContentTagParser::isValidName("tag"));
  EXPECT_TRUE(ContentTagParser::isValidName("标签"));
  EXPECT_TRUE(ContentTagParser::isValidName("tag123"));
  EXPECT_TRUE(ContentTagParser::isValidName("tag-name"));
  EXPECT_TRUE(ContentTagParser::isValidName("tag_name"));
  EXPECT_TRUE(ContentTagParser::isValidName("src/core/reactivity"));
  EXPECT_TRUE(ContentTagParser::isValidName("v3"));
}

TEST_F(ContentTagParserTest, InvalidNames) {
  EXPECT_FALSE(ContentTagParser::isValidName(""));
  EXPECT_FALSE(ContentTagParser::isValidName("/tag"));
  EXPECT_FALSE(ContentTagParser::isValidName("tag/"));
  EXPECT_FALSE(ContentTagParser::isValidName("tag//name"));
}

TEST_F(ContentTagParserTest, LeadingDigitIsInvalid) {
  EXPECT_FALSE(ContentTagParser::isValidName("3"));
  EXPECT_FALSE(ContentTagParser::isValidName("123"));
  EXPECT_FALSE(ContentTagParser::isValidName("0"));
  EXPECT_FALSE(ContentTagParser::isValidName("2啊"));
  EXPECT_FALSE(ContentTagParser::isValidName("3d"));
}

TEST_F(ContentTagParserTest, LengthCountsCodePoints) {
  EXPECT_TRUE(ContentTagParser::isValidName(std::string(100, 'a')));
  EXPECT_FALSE(ContentTagParser::isValidName(std::string(101, 'a')));

  // 100 three-byte code points
  std::string wide;
  for (int i = 0; i < 100; ++i) {
    wide += "标";
  }
  EXPECT_TRUE(ContentTagParser::isValidName(wide));
  EXPECT_FALSE(ContentTagParser::isValidName(wide + "标"));
}
