#include "codechunk_core/chunking/size_tiered_splitter.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "codechunk_core/chunking/language_separators.hpp"

namespace codechunk_core {

SizeTieredSplitter::SizeTieredSplitter(const ChunkerConfig& config, TextSplitterPtr text_splitter)
    : config_(config), text_splitter_(std::move(text_splitter)) {
  if (!text_splitter_) {
    throw std::invalid_argument("SizeTieredSplitter requires a text splitter");
  }
}

bool SizeTieredSplitter::can_handle(const FileRecord&) const {
  return true;
}

const SizeTier* SizeTieredSplitter::select_tier(const std::string& content) const {
  return config_.select_tier(code_point_length(content));
}

std::vector<std::string> SizeTieredSplitter::split(const FileRecord& file) const {
  if (!config_.enable_dynamic_sizing) {
    return {file.content};
  }

  const SizeTier* tier = select_tier(file.content);
  if (!tier || !tier->target_size) {
    if (config_.verbose_logging) {
      std::cout << "[SizeTieredSplitter] File too small to split: " << file.path << " ("
                << code_point_length(file.content) << " chars)" << std::endl;
    }
    return {file.content};
  }

  const size_t target_size = *tier->target_size;
  auto language = splitter_language_from_string(file.language);
  std::vector<std::string> separators =
      language ? separators_for(*language) : default_separators();

  if (config_.verbose_logging) {
    std::cout << "[SizeTieredSplitter] Using " << (language ? "language-specific" : "default")
              << " separators for " << file.language << ", tier " << tier->name
              << " (target " << target_size << "): " << file.path << std::endl;
  }

  std::vector<std::string> fragments =
      text_splitter_->split(file.content, target_size, tier->overlap, separators);

  if (fragments.empty()) {
    return {file.content};
  }

  // A lone fragment close to the target size would only duplicate the whole file
  if (fragments.size() == 1 &&
      static_cast<double>(code_point_length(fragments.front())) <
          static_cast<double>(target_size) * config_.single_chunk_tolerance) {
    return {file.content};
  }

  return fragments;
}

}  // namespace codechunk_core
