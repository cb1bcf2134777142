#include "codechunk_core/chunking/structural_method_splitter.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

#include "codechunk_core/chunking/brace_matcher.hpp"

namespace codechunk_core {

StructuralMethodSplitter::StructuralMethodSplitter(const ChunkerConfig& config)
    : structural_language_(config.structural_language),
      min_structural_members_(static_cast<size_t>(config.min_structural_members)),
      verbose_logging_(config.verbose_logging) {
  std::transform(structural_language_.begin(), structural_language_.end(),
                 structural_language_.begin(), ::tolower);
}

bool StructuralMethodSplitter::can_handle(const FileRecord& file) const {
  std::string language = file.language;
  std::transform(language.begin(), language.end(), language.begin(), ::tolower);
  if (language != structural_language_) {
    return false;
  }

  if (!boundary_finder_.find_declaration_start(file.content)) {
    return false;
  }

  return boundary_finder_.count_member_signatures(file.content) >= min_structural_members_;
}

std::vector<std::string> StructuralMethodSplitter::split(const FileRecord& file) const {
  return split_text(file.content);
}

std::vector<std::string> StructuralMethodSplitter::split_text(const std::string& text) const {
  try {
    auto declaration_start = boundary_finder_.find_declaration_start(text);
    if (!declaration_start) {
      if (verbose_logging_) {
        std::cout << "[StructuralSplitter] No type declaration found, keeping a single fragment"
                  << std::endl;
      }
      return {text};
    }

    auto first_member_start = boundary_finder_.find_first_member_start(text, *declaration_start);
    if (!first_member_start) {
      if (verbose_logging_) {
        std::cout << "[StructuralSplitter] No member signature found, keeping a single fragment"
                  << std::endl;
      }
      return {text};
    }

    std::vector<std::string> fragments;
    std::string header = trim_trailing_whitespace(text.substr(0, *first_member_start));
    if (!header.empty()) {
      fragments.push_back(header);
    }

    size_t scan_pos = *first_member_start;
    size_t previous_end = *first_member_start;
    size_t last_fragment_start = 0;

    while (scan_pos < text.size()) {
      auto member = boundary_finder_.find_next_member(text, scan_pos);
      if (!member) {
        break;
      }

      auto closing_brace = BraceMatcher::find_matching_brace(text, member->brace_pos);
      if (!closing_brace) {
        // Unbalanced body: the rest of the file becomes the final fragment
        std::string remainder = trim_trailing_whitespace(text.substr(previous_end));
        if (!remainder.empty()) {
          fragments.push_back(remainder);
          last_fragment_start = previous_end;
        }
        previous_end = text.size();
        break;
      }

      std::string method =
          trim_trailing_whitespace(text.substr(previous_end, *closing_brace + 1 - previous_end));
      if (!is_blank(method)) {
        fragments.push_back(method);
        last_fragment_start = previous_end;
      }

      previous_end = *closing_brace + 1;
      scan_pos = previous_end;
    }

    // Closing braces of the enclosing type stay with the last method
    if (fragments.size() > 1 && previous_end < text.size() &&
        !is_blank(text.substr(previous_end))) {
      fragments.back() = trim_trailing_whitespace(text.substr(last_fragment_start));
    }

    if (fragments.size() <= 1) {
      return {text};
    }

    if (verbose_logging_) {
      std::cout << "[StructuralSplitter] Split into " << fragments.size() << " fragments (1 header + "
                << fragments.size() - 1 << " methods)" << std::endl;
    }
    return fragments;
  } catch (const std::regex_error& e) {
    std::cerr << "[StructuralSplitter] Pattern engine failure, keeping a single fragment: "
              << e.what() << std::endl;
    return {text};
  }
}

}  // namespace codechunk_core
