#pragma once
#include <memory>
#include <vector>

#include "codechunk_core/chunker_config.hpp"
#include "codechunk_core/chunking/fragment_splitter.hpp"
#include "codechunk_core/chunking/text_splitter.hpp"

/**
 * @class FragmentSplitterFactory
 * @brief Manages and provides the correct FragmentSplitter for a given file.
 *
 * Splitters are consulted in registration order: the structural splitter first,
 * then the size-tiered splitter, which accepts every file. This class is
 * non-copyable and non-movable.
 */
namespace codechunk_core {
class FragmentSplitterFactory {
 public:
  /**
   * @brief Constructs the factory and registers all available splitters.
   * @param text_splitter Generic splitter the size-tiered path delegates to.
   */
  FragmentSplitterFactory(const ChunkerConfig& config, TextSplitterPtr text_splitter);

  /**
   * @brief Returns the first registered splitter that accepts the file.
   *
   * @param file The file that needs to be split.
   * @return A constant reference to the appropriate FragmentSplitter.
   * @throw std::runtime_error if no suitable splitter is found.
   */
  const FragmentSplitter& get_splitter_for(const FileRecord& file) const;

  FragmentSplitterFactory(const FragmentSplitterFactory&) = delete;
  FragmentSplitterFactory& operator=(const FragmentSplitterFactory&) = delete;
  FragmentSplitterFactory(FragmentSplitterFactory&&) = delete;
  FragmentSplitterFactory& operator=(FragmentSplitterFactory&&) = delete;

 private:
  std::vector<FragmentSplitterPtr> splitters_;
};
}  // namespace codechunk_core
