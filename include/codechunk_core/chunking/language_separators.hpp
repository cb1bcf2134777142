#pragma once

#include <optional>
#include <string>
#include <vector>

namespace codechunk_core {

// Languages with a dedicated separator hierarchy for the generic splitter
enum class SplitterLanguage {
  Python,
  Java,
  JavaScript,
  TypeScript,
  Go,
  Cpp,
  Html,
  C,
  CSharp,
  Kotlin,
  Php,
  Ruby,
  Rust,
  Scala,
  Swift,
  Markdown,
  Rst,
  Lua,
  Perl,
  Haskell,
  Elixir,
  Proto,
  Sol,
  Cobol,
  Latex
};

// Lowercase language tag, e.g. "c_sharp"
std::string to_string(SplitterLanguage language);

// Case-insensitive lookup; std::nullopt for unrecognized tags
std::optional<SplitterLanguage> splitter_language_from_string(const std::string& tag);

// All recognized languages in declaration order
const std::vector<SplitterLanguage>& all_splitter_languages();

// Separator hierarchy, most structural first, always ending with the empty separator
std::vector<std::string> separators_for(SplitterLanguage language);

// Language-agnostic hierarchy
std::vector<std::string> default_separators();

}  // namespace codechunk_core
