#include "codechunk_core/chunking/context_extractor.hpp"

#include <cctype>
#include <iostream>

#include "codechunk_core/chunking/line_patterns.hpp"

namespace codechunk_core {

namespace {

std::regex line_pattern(const char* expression) {
  return std::regex(expression);
}

// True if the parameter list opened at open_paren is followed by a '{'
bool has_body(const std::string& text, size_t open_paren) {
  size_t pos = text.find(')', open_paren);
  if (pos == std::string::npos) {
    return false;
  }
  ++pos;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return pos < text.size() && text[pos] == '{';
}

}  // namespace

ContextExtractor::ContextExtractor(const ChunkerConfig& config)
    : keyword_denylist_(config.keyword_denylist.begin(), config.keyword_denylist.end()),
      verbose_logging_(config.verbose_logging) {
  patterns_[LanguageFamily::Python] = {line_pattern(R"(^class[ \t]+(\w+))"),
                                       line_pattern(R"(^(?:async[ \t]+)?def[ \t]+(\w+))")};

  patterns_[LanguageFamily::JavaScript] = {
      line_pattern(R"(^(?:export[ \t]+)?class[ \t]+(\w+))"),
      line_pattern(R"(^(?:export[ \t]+)?(?:async[ \t]+)?function[ \t]+(\w+))")};

  patterns_[LanguageFamily::JavaLike] = {
      line_pattern(
          R"(^(?:public[ \t]+|private[ \t]+|protected[ \t]+)?(?:abstract[ \t]+|final[ \t]+|static[ \t]+)?(?:class|interface|enum)[ \t]+(\w+))"),
      line_pattern(
          R"(^[ \t]*(?:public|private|protected)[ \t]+(?:static[ \t]+)?(?:final[ \t]+)?(?:synchronized[ \t]+)?(?:[\w<>\[\], \t]+[ \t]+)?(\w+)[ \t]*\()")};

  // Go has no classes; receivers are not reported as class names
  patterns_[LanguageFamily::Go] = {
      std::nullopt, line_pattern(R"(^func[ \t]+(?:\(\w+[ \t]+\*?\w+\)[ \t]+)?(\w+))")};

  patterns_[LanguageFamily::Rust] = {line_pattern(R"(^(?:pub[ \t]+)?struct[ \t]+(\w+))"),
                                     line_pattern(R"(^(?:pub[ \t]+)?fn[ \t]+(\w+))")};

  // The parameter list and body of a C function may continue on later lines
  patterns_[LanguageFamily::CFamily] = {line_pattern(R"(^(?:class|struct)[ \t]+(\w+))"),
                                        line_pattern(R"(^(?:\w+[ \t]+)+(\w+)[ \t]*\()"),
                                        true};
}

ChunkMetadata ContextExtractor::extract(const std::string& text,
                                        const std::string& language) const {
  ChunkMetadata metadata;

  auto it = patterns_.find(language_family_from_string(language));
  if (it == patterns_.end()) {
    return metadata;
  }

  const PatternSet& pattern_set = it->second;
  if (pattern_set.class_pattern) {
    metadata.class_name = first_identifier(*pattern_set.class_pattern, text, false);
  }
  if (pattern_set.function_pattern) {
    metadata.function_name = first_identifier(*pattern_set.function_pattern, text,
                                              pattern_set.function_requires_body);
  }
  return metadata;
}

std::optional<std::string> ContextExtractor::first_identifier(const std::regex& pattern,
                                                              const std::string& text,
                                                              bool requires_body) const {
  std::optional<std::string> identifier;
  try {
    search_lines(text, 0, pattern, [&](size_t line_start, const std::smatch& match) {
      std::string candidate = match[1].str();
      if (candidate.empty() || keyword_denylist_.count(candidate) > 0) {
        return false;
      }
      if (requires_body &&
          !has_body(text, line_start + static_cast<size_t>(match.length(0)) - 1)) {
        return false;
      }
      identifier = candidate;
      return true;
    });
  } catch (const std::regex_error& e) {
    if (verbose_logging_) {
      std::cerr << "[ContextExtractor] Failed to extract context info: " << e.what() << std::endl;
    }
  }
  return identifier;
}

}  // namespace codechunk_core
