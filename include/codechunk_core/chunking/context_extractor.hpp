#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "codechunk_core/chunker_config.hpp"
#include "codechunk_core/types.hpp"

namespace codechunk_core {

/**
 * @class ContextExtractor
 * @brief Detects the enclosing class and function name of a fragment with
 *        per-language-family, line-anchored patterns.
 *
 * Patterns are matched line by line. Identifiers found in the keyword denylist
 * are skipped. Pattern engine failures yield "not detected" for the affected
 * field only.
 */
class ContextExtractor {
 public:
  explicit ContextExtractor(const ChunkerConfig& config);

  ChunkMetadata extract(const std::string& text, const std::string& language) const;

 private:
  struct PatternSet {
    std::optional<std::regex> class_pattern;
    std::optional<std::regex> function_pattern;
    bool function_requires_body = false;  // match must be followed by "(...) {"
  };

  std::optional<std::string> first_identifier(const std::regex& pattern,
                                              const std::string& text,
                                              bool requires_body) const;

  std::map<LanguageFamily, PatternSet> patterns_;
  std::unordered_set<std::string> keyword_denylist_;
  bool verbose_logging_;
};

}  // namespace codechunk_core
