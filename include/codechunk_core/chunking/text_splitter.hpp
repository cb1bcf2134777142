#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace codechunk_core {

// Length of a UTF-8 string in code points; falls back to bytes for invalid input
size_t code_point_length(const std::string& text);

/**
 * @class TextSplitter
 * @brief Generic, language-agnostic splitting capability used when a file does
 *        not qualify for structural splitting.
 *
 * Implementations must be deterministic and safe to call concurrently.
 */
class TextSplitter {
 public:
  virtual ~TextSplitter() = default;

  /**
   * @brief Splits text into fragments of at most target_size code points where
   *        the separators allow it.
   * @param separators Descending separator hierarchy; the empty string means
   *        "split between code points".
   */
  virtual std::vector<std::string> split(const std::string& text,
                                         size_t target_size,
                                         size_t overlap,
                                         const std::vector<std::string>& separators) const = 0;
};

using TextSplitterPtr = std::shared_ptr<TextSplitter>;

/**
 * @class RecursiveTextSplitter
 * @brief Splits on the first separator present in the text, keeps each
 *        separator at the start of the piece that follows it, recurses into
 *        pieces that are still too long with the remaining separators, then
 *        merges neighbouring small pieces back up to the target size.
 *
 * Emitted fragments are whitespace-trimmed and never empty.
 */
class RecursiveTextSplitter : public TextSplitter {
 public:
  std::vector<std::string> split(const std::string& text,
                                 size_t target_size,
                                 size_t overlap,
                                 const std::vector<std::string>& separators) const override;

 private:
  using Piece = std::pair<std::string, size_t>;  // text and its code-point length

  std::vector<std::string> split_recursive(const std::string& text,
                                           const std::vector<std::string>& separators,
                                           size_t target_size,
                                           size_t overlap) const;

  std::vector<std::string> merge_pieces(const std::vector<Piece>& pieces,
                                        size_t target_size,
                                        size_t overlap) const;

  static std::vector<std::string> split_keeping_separator(const std::string& text,
                                                          const std::string& separator);
};

}  // namespace codechunk_core
