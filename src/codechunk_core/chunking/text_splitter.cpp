#include "codechunk_core/chunking/text_splitter.hpp"

#include <utf8.h>

#include <deque>

#include "codechunk_core/chunking/fragment_splitter.hpp"
#include "codechunk_core/chunking/language_separators.hpp"

namespace codechunk_core {

namespace {

std::string strip_whitespace(const std::string& text) {
  const char* whitespace = " \t\r\n\f\v";
  size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

}  // namespace

size_t code_point_length(const std::string& text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.size();
  }
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::vector<std::string> RecursiveTextSplitter::split(
    const std::string& text,
    size_t target_size,
    size_t overlap,
    const std::vector<std::string>& separators) const {
  if (target_size == 0) {
    throw ChunkingError("Splitter target size must be positive");
  }
  if (overlap >= target_size) {
    throw ChunkingError("Splitter overlap must be smaller than the target size");
  }
  if (text.empty()) {
    return {};
  }

  return split_recursive(text, separators.empty() ? default_separators() : separators,
                         target_size, overlap);
}

std::vector<std::string> RecursiveTextSplitter::split_recursive(
    const std::string& text,
    const std::vector<std::string>& separators,
    size_t target_size,
    size_t overlap) const {
  // Pick the first separator that occurs in the text
  std::string separator = separators.back();
  std::vector<std::string> remaining_separators;
  for (size_t i = 0; i < separators.size(); ++i) {
    const std::string& candidate = separators[i];
    if (candidate.empty()) {
      separator = candidate;
      break;
    }
    if (text.find(candidate) != std::string::npos) {
      separator = candidate;
      remaining_separators.assign(separators.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                  separators.end());
      break;
    }
  }

  std::vector<std::string> final_fragments;
  std::vector<Piece> small_pieces;

  auto flush_small_pieces = [&]() {
    if (small_pieces.empty()) {
      return;
    }
    auto merged = merge_pieces(small_pieces, target_size, overlap);
    final_fragments.insert(final_fragments.end(), merged.begin(), merged.end());
    small_pieces.clear();
  };

  for (auto& piece : split_keeping_separator(text, separator)) {
    size_t length = code_point_length(piece);
    if (length < target_size) {
      small_pieces.emplace_back(std::move(piece), length);
      continue;
    }

    flush_small_pieces();
    if (remaining_separators.empty()) {
      final_fragments.push_back(std::move(piece));
    } else {
      auto nested = split_recursive(piece, remaining_separators, target_size, overlap);
      final_fragments.insert(final_fragments.end(), nested.begin(), nested.end());
    }
  }
  flush_small_pieces();

  return final_fragments;
}

std::vector<std::string> RecursiveTextSplitter::merge_pieces(const std::vector<Piece>& pieces,
                                                             size_t target_size,
                                                             size_t overlap) const {
  std::vector<std::string> fragments;
  std::deque<const Piece*> window;
  size_t window_length = 0;

  auto emit_window = [&]() {
    std::string joined;
    for (const Piece* piece : window) {
      joined += piece->first;
    }
    std::string fragment = strip_whitespace(joined);
    if (!fragment.empty()) {
      fragments.push_back(std::move(fragment));
    }
  };

  for (const Piece& piece : pieces) {
    if (window_length + piece.second > target_size && !window.empty()) {
      emit_window();
      // Keep at most `overlap` code points as the start of the next fragment
      while (!window.empty() &&
             (window_length > overlap || window_length + piece.second > target_size)) {
        window_length -= window.front()->second;
        window.pop_front();
      }
    }
    window.push_back(&piece);
    window_length += piece.second;
  }

  if (!window.empty()) {
    emit_window();
  }
  return fragments;
}

std::vector<std::string> RecursiveTextSplitter::split_keeping_separator(
    const std::string& text, const std::string& separator) {
  std::vector<std::string> pieces;

  if (separator.empty()) {
    if (!utf8::is_valid(text.begin(), text.end())) {
      for (char c : text) {
        pieces.emplace_back(1, c);
      }
      return pieces;
    }
    for (auto it = text.begin(); it != text.end();) {
      auto code_point_start = it;
      utf8::next(it, text.end());
      pieces.emplace_back(code_point_start, it);
    }
    return pieces;
  }

  size_t piece_start = 0;
  size_t found = text.find(separator);
  while (found != std::string::npos) {
    if (found > piece_start) {
      pieces.push_back(text.substr(piece_start, found - piece_start));
    }
    piece_start = found;
    found = text.find(separator, found + separator.size());
  }
  if (piece_start < text.size()) {
    pieces.push_back(text.substr(piece_start));
  }
  return pieces;
}

}  // namespace codechunk_core
