#pragma once

#include <string>
#include <vector>

#include "codechunk_core/chunker_config.hpp"
#include "codechunk_core/chunking/fragment_splitter.hpp"
#include "codechunk_core/chunking/structural_boundary_finder.hpp"

namespace codechunk_core {

/**
 * @class StructuralMethodSplitter
 * @brief Splits Java-like source into a header fragment followed by one
 *        fragment per method.
 *
 * The header holds everything before the first member signature (package,
 * imports, type declaration, fields). Every method fragment starts where the
 * previous fragment ended, so comments and blank lines between two methods
 * belong to the method that follows them. Text after the last method (the
 * closing braces of the enclosing type) is attached to the last fragment.
 */
class StructuralMethodSplitter : public FragmentSplitter {
 public:
  explicit StructuralMethodSplitter(const ChunkerConfig& config);

  /**
   * @brief Applicability gate: the declared language is the structural language,
   *        a type declaration exists and at least min_structural_members member
   *        signatures are present.
   */
  bool can_handle(const FileRecord& file) const override;

  std::vector<std::string> split(const FileRecord& file) const override;

  std::string name() const override {
    return "structural";
  }

  /**
   * @brief Splits raw text. Returns the whole text as a single fragment when no
   *        declaration or member is found, or when splitting would produce a
   *        single fragment anyway.
   */
  std::vector<std::string> split_text(const std::string& text) const;

 private:
  std::string structural_language_;
  size_t min_structural_members_;
  bool verbose_logging_;
  StructuralBoundaryFinder boundary_finder_;
};

}  // namespace codechunk_core
