#pragma once

#include <cstddef>
#include <regex>
#include <string>

namespace codechunk_core {

// Lines longer than this are never matched against a line-anchored pattern
constexpr size_t MAX_PATTERN_LINE_LENGTH = 1024;

/**
 * @brief Matches a pattern at the start of every line of text, beginning at
 *        from_offset (which counts as a line start).
 *
 * Each line is searched on its own, so a match never crosses a newline and the
 * regex engine only ever sees bounded input.
 *
 * @param visit Called as visit(line_start, match) for every matching line; the
 *        scan stops as soon as it returns true.
 * @return true if visit accepted a match.
 */
template <typename Visitor>
bool search_lines(const std::string& text,
                  size_t from_offset,
                  const std::regex& pattern,
                  Visitor&& visit) {
  size_t line_start = from_offset;
  while (line_start < text.size()) {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }

    if (line_end - line_start <= MAX_PATTERN_LINE_LENGTH) {
      std::smatch match;
      auto begin = text.cbegin() + static_cast<std::ptrdiff_t>(line_start);
      auto end = text.cbegin() + static_cast<std::ptrdiff_t>(line_end);
      if (std::regex_search(begin, end, match, pattern,
                            std::regex_constants::match_continuous) &&
          visit(line_start, match)) {
        return true;
      }
    }

    line_start = line_end + 1;
  }
  return false;
}

}  // namespace codechunk_core
