#include "codechunk_core/chunking/brace_matcher.hpp"

namespace codechunk_core {

std::optional<size_t> BraceMatcher::find_matching_brace(const std::string& text, size_t open_pos) {
  if (open_pos >= text.size() || text[open_pos] != '{') {
    return std::nullopt;
  }

  int depth = 1;
  bool in_string = false;
  bool in_char = false;
  bool in_line_comment = false;
  bool in_block_comment = false;

  size_t pos = open_pos + 1;
  while (pos < text.size() && depth > 0) {
    const char c = text[pos];
    const char prev = text[pos - 1];
    const char next = pos + 1 < text.size() ? text[pos + 1] : '\0';

    if (c == '"' && prev != '\\' && !in_char && !in_line_comment && !in_block_comment) {
      in_string = !in_string;
    } else if (c == '\'' && prev != '\\' && !in_string && !in_line_comment && !in_block_comment) {
      in_char = !in_char;
    } else if (c == '/' && next == '/' && !in_string && !in_char && !in_block_comment) {
      in_line_comment = true;
    } else if (c == '\n' && in_line_comment) {
      in_line_comment = false;
    } else if (c == '/' && next == '*' && !in_string && !in_char) {
      in_block_comment = true;
    } else if (c == '*' && next == '/' && in_block_comment) {
      in_block_comment = false;
      ++pos;  // skip the '/' of "*/"
    } else if (!in_string && !in_char && !in_line_comment && !in_block_comment) {
      if (c == '{') {
        ++depth;
      } else if (c == '}') {
        --depth;
      }
    }

    ++pos;
  }

  if (depth != 0) {
    return std::nullopt;
  }
  return pos - 1;
}

}  // namespace codechunk_core
