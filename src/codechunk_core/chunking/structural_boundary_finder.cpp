#include "codechunk_core/chunking/structural_boundary_finder.hpp"

#include <cctype>

#include "codechunk_core/chunking/line_patterns.hpp"

namespace codechunk_core {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_throws_clause_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == ',' || is_space(c);
}

size_t skip_whitespace(const std::string& text, size_t pos) {
  while (pos < text.size() && is_space(text[pos])) {
    ++pos;
  }
  return pos;
}

// Position of the '{' that opens a member body, given the '(' of its parameter
// list. Parameters, a throws clause and the brace may sit on later lines.
std::optional<size_t> find_body_brace(const std::string& text, size_t open_paren) {
  size_t close_paren = text.find(')', open_paren);
  if (close_paren == std::string::npos) {
    return std::nullopt;
  }

  size_t pos = skip_whitespace(text, close_paren + 1);
  if (text.compare(pos, 6, "throws") == 0 && pos + 6 < text.size() && is_space(text[pos + 6])) {
    size_t clause_end = pos + 6;
    while (clause_end < text.size() && is_throws_clause_char(text[clause_end])) {
      ++clause_end;
    }
    // "throws", at least one space, at least one more clause character
    if (clause_end >= pos + 8 && clause_end < text.size() && text[clause_end] == '{') {
      return clause_end;
    }
    return std::nullopt;
  }

  if (pos < text.size() && text[pos] == '{') {
    return pos;
  }
  return std::nullopt;
}

}  // namespace

StructuralBoundaryFinder::StructuralBoundaryFinder()
    : declaration_regex_(
          R"(^[ \t]*(public[ \t]+|private[ \t]+|protected[ \t]+)?(abstract[ \t]+|final[ \t]+|static[ \t]+)?(class|interface|enum|record)[ \t]+\w+)"),
      member_head_regex_(
          R"(^[ \t]*(public|private|protected)[ \t]+(?:static[ \t]+)?(?:final[ \t]+)?(?:synchronized[ \t]+)?[\w<>\[\], \t]+[ \t]+\w+[ \t]*\()"),
      member_count_regex_(
          R"(^[ \t]*(public|private|protected)[ \t]+(?:static[ \t]+)?[\w<>\[\], \t]+[ \t]+\w+[ \t]*\()") {}

std::optional<size_t> StructuralBoundaryFinder::find_declaration_start(
    const std::string& text) const {
  std::optional<size_t> start;
  search_lines(text, 0, declaration_regex_, [&](size_t line_start, const std::smatch&) {
    start = line_start;
    return true;
  });
  return start;
}

std::optional<size_t> StructuralBoundaryFinder::find_first_member_start(
    const std::string& text, size_t from_offset) const {
  auto member = find_next_member(text, from_offset);
  if (!member) {
    return std::nullopt;
  }
  return member->start;
}

std::optional<MemberSignature> StructuralBoundaryFinder::find_next_member(
    const std::string& text, size_t from_offset) const {
  std::optional<MemberSignature> member;
  search_lines(text, from_offset, member_head_regex_,
               [&](size_t line_start, const std::smatch& match) {
                 size_t open_paren = line_start + static_cast<size_t>(match.length(0)) - 1;
                 auto brace_pos = find_body_brace(text, open_paren);
                 if (!brace_pos) {
                   return false;
                 }
                 member = MemberSignature{line_start, *brace_pos};
                 return true;
               });
  return member;
}

size_t StructuralBoundaryFinder::count_member_signatures(const std::string& text) const {
  size_t count = 0;
  search_lines(text, 0, member_count_regex_, [&](size_t, const std::smatch&) {
    ++count;
    return false;
  });
  return count;
}

}  // namespace codechunk_core
