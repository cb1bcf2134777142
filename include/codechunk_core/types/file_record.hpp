#pragma once

#include <cstddef>
#include <string>

namespace codechunk_core {

// A source file as handed over by the repository fetcher. Never mutated.
struct FileRecord {
  std::string path;      // repo-relative
  std::string content;   // decoded UTF-8 text
  std::string language;  // lowercase tag or "unknown"
  size_t size = 0;       // byte length
};

// Language families that carry their own context patterns.
enum class LanguageFamily { Python, JavaScript, JavaLike, Go, Rust, CFamily, Unrecognized };

// Conversion utilities
std::string to_string(LanguageFamily family);
LanguageFamily language_family_from_string(const std::string& language);

// True if the text is empty or holds only whitespace
bool is_blank(const std::string& text);

}  // namespace codechunk_core
