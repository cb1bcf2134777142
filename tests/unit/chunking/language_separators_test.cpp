#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "codechunk_core/chunking/language_separators.hpp"

namespace codechunk_core {

TEST(LanguageSeparatorsTest, TwentyFiveDistinctLanguages) {
  const auto& languages = all_splitter_languages();

  EXPECT_EQ(languages.size(), 25u);

  std::set<std::string> tags;
  for (SplitterLanguage language : languages) {
    tags.insert(to_string(language));
  }
  EXPECT_EQ(tags.size(), 25u);
}

TEST(LanguageSeparatorsTest, TagsRoundTrip) {
  for (SplitterLanguage language : all_splitter_languages()) {
    auto parsed = splitter_language_from_string(to_string(language));
    ASSERT_TRUE(parsed.has_value()) << to_string(language);
    EXPECT_EQ(*parsed, language);
  }
}

TEST(LanguageSeparatorsTest, LookupIsCaseInsensitive) {
  EXPECT_EQ(splitter_language_from_string("JAVA"), SplitterLanguage::Java);
  EXPECT_EQ(splitter_language_from_string("C_Sharp"), SplitterLanguage::CSharp);
  EXPECT_EQ(splitter_language_from_string("cpp"), SplitterLanguage::Cpp);
}

TEST(LanguageSeparatorsTest, UnknownTagsAreNotRecognized) {
  EXPECT_FALSE(splitter_language_from_string("unknown").has_value());
  EXPECT_FALSE(splitter_language_from_string("bash").has_value());
  EXPECT_FALSE(splitter_language_from_string("").has_value());
}

TEST(LanguageSeparatorsTest, EveryHierarchyEndsWithEmptySeparator) {
  for (SplitterLanguage language : all_splitter_languages()) {
    std::vector<std::string> separators = separators_for(language);
    ASSERT_FALSE(separators.empty()) << to_string(language);
    EXPECT_EQ(separators.back(), "") << to_string(language);
  }
}

TEST(LanguageSeparatorsTest, CodeHierarchiesStartWithDeclarations) {
  EXPECT_EQ(separators_for(SplitterLanguage::Python).front(), "\nclass ");
  EXPECT_EQ(separators_for(SplitterLanguage::Go).front(), "\nfunc ");
  EXPECT_EQ(separators_for(SplitterLanguage::Rust).front(), "\nfn ");
  EXPECT_EQ(separators_for(SplitterLanguage::Markdown).front(), "\n# ");
}

TEST(LanguageSeparatorsTest, DefaultHierarchy) {
  std::vector<std::string> expected = {"\n\n", "\n", " ", ""};
  EXPECT_EQ(default_separators(), expected);
}

}  // namespace codechunk_core
