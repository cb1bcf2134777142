#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codechunk_core/chunker_config.hpp"
#include "codechunk_core/chunking/context_extractor.hpp"
#include "codechunk_core/chunking/fragment_splitter_factory.hpp"
#include "codechunk_core/chunking/text_splitter.hpp"
#include "codechunk_core/types.hpp"

namespace codechunk_core {

/**
 * @class CodeChunker
 * @brief Entry point of the chunking engine.
 *
 * Chooses between structural and size-tiered splitting for each file, tags every
 * fragment with a "File: <path>" header, attaches detected class/function names
 * and assigns deterministic ids. Configuration is fixed at construction, so a
 * single instance can serve many threads at once.
 */
class CodeChunker {
 public:
  explicit CodeChunker(const ChunkerConfig& config = ChunkerConfig{},
                       TextSplitterPtr text_splitter = std::make_shared<RecursiveTextSplitter>());

  /**
   * @brief Splits a file into chunks.
   *
   * Blank content yields no chunks; any other content yields at least one.
   * Failures while splitting are logged and degrade to a single chunk holding
   * the whole file.
   *
   * @param file The file to chunk.
   * @param scope_id Identifier of the enclosing repository, part of every chunk id.
   */
  std::vector<Chunk> chunk_file(const FileRecord& file, const std::string& scope_id) const;

  // Languages with a dedicated separator hierarchy
  std::vector<std::string> get_supported_languages() const;

  // Active configuration summary (debugging/monitoring)
  nlohmann::json get_chunk_stats() const;

  const ChunkerConfig& config() const {
    return config_;
  }

  CodeChunker(const CodeChunker&) = delete;
  CodeChunker& operator=(const CodeChunker&) = delete;

 private:
  Chunk create_chunk(const FileRecord& file,
                     const std::string& scope_id,
                     size_t index,
                     const std::string& text) const;
  std::vector<Chunk> create_single_chunk(const FileRecord& file,
                                         const std::string& scope_id,
                                         bool detect_context = true) const;

  ChunkerConfig config_;
  FragmentSplitterFactory splitter_factory_;
  ContextExtractor context_extractor_;
};

}  // namespace codechunk_core
