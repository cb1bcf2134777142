#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codechunk_core/chunking/fragment_splitter.hpp"
#include "codechunk_core/chunking/language_separators.hpp"
#include "codechunk_core/chunking/text_splitter.hpp"
#include "../../common/utilities_test.hpp"

namespace codechunk_core {

using codechunk_tests::TestUtilities;

class RecursiveTextSplitterTest : public ::testing::Test {
 protected:
  RecursiveTextSplitter splitter_;
};

TEST(CodePointLengthTest, CountsCodePointsNotBytes) {
  EXPECT_EQ(code_point_length(""), 0u);
  EXPECT_EQ(code_point_length("abc"), 3u);
  EXPECT_EQ(code_point_length("h\xC3\xA9llo"), 5u);        // héllo
  EXPECT_EQ(code_point_length("\xE2\x82\xAC" "1"), 2u);    // €1
}

TEST(CodePointLengthTest, InvalidUtf8FallsBackToBytes) {
  EXPECT_EQ(code_point_length("ab\xFF"), 3u);
}

TEST_F(RecursiveTextSplitterTest, ShortTextIsOneFragment) {
  auto fragments = splitter_.split("int main() { return 0; }", 100, 0, {});

  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0], "int main() { return 0; }");
}

TEST_F(RecursiveTextSplitterTest, EmptyAndBlankTextProduceNothing) {
  EXPECT_TRUE(splitter_.split("", 10, 0, {}).empty());
  EXPECT_TRUE(splitter_.split("   \n  \n ", 10, 0, {}).empty());
}

TEST_F(RecursiveTextSplitterTest, SeparatorStartsTheFollowingPiece) {
  auto fragments = splitter_.split("alpha\n\nbeta\n\ngamma", 8, 0, default_separators());

  std::vector<std::string> expected = {"alpha", "beta", "gamma"};
  EXPECT_EQ(fragments, expected);
}

TEST_F(RecursiveTextSplitterTest, FragmentsNeverExceedTarget) {
  std::string text;
  for (int i = 0; i < 300; ++i) {
    text += "word" + std::to_string(i % 10) + " ";
    if (i % 17 == 16) {
      text += "\n";
    }
    if (i % 51 == 50) {
      text += "\n";
    }
  }

  auto fragments = splitter_.split(text, 100, 0, default_separators());

  ASSERT_GT(fragments.size(), 1u);
  for (const auto& fragment : fragments) {
    EXPECT_LE(code_point_length(fragment), 100u) << fragment;
    EXPECT_FALSE(fragment.empty());
  }
  EXPECT_EQ(TestUtilities::strip_all_whitespace(TestUtilities::join_fragments(fragments)),
            TestUtilities::strip_all_whitespace(text));
}

TEST_F(RecursiveTextSplitterTest, UnbreakableTokenIsCutByCharacters) {
  std::string token(250, 'a');

  auto fragments = splitter_.split(token, 100, 0, default_separators());

  ASSERT_EQ(fragments.size(), 3u);
  EXPECT_EQ(fragments[0].size(), 100u);
  EXPECT_EQ(fragments[1].size(), 100u);
  EXPECT_EQ(fragments[2].size(), 50u);
}

TEST_F(RecursiveTextSplitterTest, CharacterCutsRespectUtf8Boundaries) {
  std::string token;
  for (int i = 0; i < 250; ++i) {
    token += "\xC3\xA9";  // é
  }

  auto fragments = splitter_.split(token, 100, 0, default_separators());

  ASSERT_EQ(fragments.size(), 3u);
  EXPECT_EQ(code_point_length(fragments[0]), 100u);
  EXPECT_EQ(fragments[0].size(), 200u);
  EXPECT_EQ(code_point_length(fragments[2]), 50u);
  EXPECT_EQ(TestUtilities::join_fragments(fragments), token);
}

TEST_F(RecursiveTextSplitterTest, OverlapRepeatsTrailingPieces) {
  std::string text;
  for (int i = 0; i < 50; ++i) {
    if (i > 0) {
      text += " ";
    }
    text += "w" + std::string(i < 10 ? "0" : "") + std::to_string(i);
  }

  auto fragments = splitter_.split(text, 20, 8, {" ", ""});

  ASSERT_GT(fragments.size(), 2u);
  EXPECT_EQ(fragments[0], "w00 w01 w02 w03 w04");
  EXPECT_EQ(fragments[1].rfind("w03 w04", 0), 0u);
  for (const auto& fragment : fragments) {
    EXPECT_LE(code_point_length(fragment), 20u);
  }
}

TEST_F(RecursiveTextSplitterTest, LanguageSeparatorsPreferDeclarations) {
  std::string text =
      "def first():\n"
      "    return 1\n"
      "\n"
      "def second():\n"
      "    return 2\n";

  auto fragments = splitter_.split(text, 30, 0, separators_for(SplitterLanguage::Python));

  ASSERT_EQ(fragments.size(), 2u);
  EXPECT_EQ(fragments[0].rfind("def first():", 0), 0u);
  EXPECT_EQ(fragments[1].rfind("def second():", 0), 0u);
}

TEST_F(RecursiveTextSplitterTest, IsDeterministic) {
  std::string text = TestUtilities::make_text_of_length(5000);

  EXPECT_EQ(splitter_.split(text, 700, 0, {}), splitter_.split(text, 700, 0, {}));
}

TEST_F(RecursiveTextSplitterTest, InvalidArgumentsThrow) {
  EXPECT_THROW(splitter_.split("text", 0, 0, {}), ChunkingError);
  EXPECT_THROW(splitter_.split("text", 10, 10, {}), ChunkingError);
  EXPECT_THROW(splitter_.split("text", 10, 25, {}), ChunkingError);
}

}  // namespace codechunk_core
