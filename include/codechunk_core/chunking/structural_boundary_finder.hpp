#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>

namespace codechunk_core {

// A member signature located in the text, with absolute offsets
struct MemberSignature {
  size_t start;      // start of the line holding the signature
  size_t brace_pos;  // the '{' that opens the member body
};

/**
 * @class StructuralBoundaryFinder
 * @brief Line-anchored searches for type declarations and member signatures
 *        in Java-like source.
 *
 * Patterns are matched one line at a time and never span a newline. Only the
 * parameter list, a throws clause and the opening brace of a member may
 * continue on later lines. Lines longer than MAX_PATTERN_LINE_LENGTH are
 * skipped.
 *
 * The patterns are compiled once at construction; all queries are read-only
 * and may run concurrently on the same instance.
 */
class StructuralBoundaryFinder {
 public:
  StructuralBoundaryFinder();

  // Start of the first class/interface/enum/record declaration
  std::optional<size_t> find_declaration_start(const std::string& text) const;

  // Start of the first member signature at or after from_offset
  std::optional<size_t> find_first_member_start(const std::string& text, size_t from_offset) const;

  // Next member signature (start and opening brace) at or after from_offset
  std::optional<MemberSignature> find_next_member(const std::string& text, size_t from_offset) const;

  // Number of line-anchored member signatures, ignoring whether their bodies are valid
  size_t count_member_signatures(const std::string& text) const;

 private:
  std::regex declaration_regex_;
  std::regex member_head_regex_;  // signature up to its '('
  std::regex member_count_regex_;
};

}  // namespace codechunk_core
