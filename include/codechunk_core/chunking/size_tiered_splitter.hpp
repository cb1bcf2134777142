#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codechunk_core/chunker_config.hpp"
#include "codechunk_core/chunking/fragment_splitter.hpp"
#include "codechunk_core/chunking/text_splitter.hpp"

namespace codechunk_core {

/**
 * @class SizeTieredSplitter
 * @brief Generic path: picks a target fragment size from the content length and
 *        delegates to a TextSplitter with a language-specific separator hierarchy.
 *
 * Accepts every file, so it is registered last as the fallback.
 */
class SizeTieredSplitter : public FragmentSplitter {
 public:
  SizeTieredSplitter(const ChunkerConfig& config, TextSplitterPtr text_splitter);

  bool can_handle(const FileRecord& file) const override;

  std::vector<std::string> split(const FileRecord& file) const override;

  std::string name() const override {
    return "size-tiered";
  }

  // Tier selected for the given content, or nullptr when no tier matches
  const SizeTier* select_tier(const std::string& content) const;

 private:
  ChunkerConfig config_;
  TextSplitterPtr text_splitter_;
};

}  // namespace codechunk_core
