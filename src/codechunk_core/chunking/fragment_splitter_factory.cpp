#include "codechunk_core/chunking/fragment_splitter_factory.hpp"
#include "codechunk_core/chunking/size_tiered_splitter.hpp"
#include "codechunk_core/chunking/structural_method_splitter.hpp"

#include <stdexcept>
#include <utility>

namespace codechunk_core {
FragmentSplitterFactory::FragmentSplitterFactory(const ChunkerConfig& config,
                                                 TextSplitterPtr text_splitter) {
  splitters_.push_back(std::make_unique<StructuralMethodSplitter>(config));
  splitters_.push_back(std::make_unique<SizeTieredSplitter>(config, std::move(text_splitter)));
}

const FragmentSplitter& FragmentSplitterFactory::get_splitter_for(const FileRecord& file) const {
  for (const auto& splitter : splitters_) {
    if (splitter->can_handle(file)) {
      return *splitter;
    }
  }
  throw std::runtime_error("No suitable fragment splitter found for " + file.path);
}
}  // namespace codechunk_core
