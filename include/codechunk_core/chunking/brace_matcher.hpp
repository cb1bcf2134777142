#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace codechunk_core {

/**
 * @class BraceMatcher
 * @brief Finds the closing brace that matches a given opening brace.
 *
 * The scan is aware of double-quoted strings, single-quoted character literals,
 * line comments and block comments, so braces inside them are not counted.
 * An escaped quote is recognized by looking at the immediately preceding
 * character only; `\\"` is therefore treated as an escaped quote.
 */
class BraceMatcher {
 public:
  /**
   * @param text The text to scan.
   * @param open_pos Index of the opening '{' in text.
   * @return Index of the matching '}', or std::nullopt if open_pos is not a '{'
   *         or the text ends before the depth returns to zero.
   */
  static std::optional<size_t> find_matching_brace(const std::string& text, size_t open_pos);
};

}  // namespace codechunk_core
