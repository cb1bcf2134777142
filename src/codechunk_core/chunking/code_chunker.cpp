#include "codechunk_core/chunking/code_chunker.hpp"

#include <iostream>
#include <utility>

#include "codechunk_core/chunk_ids.hpp"
#include "codechunk_core/chunking/language_separators.hpp"

namespace codechunk_core {

CodeChunker::CodeChunker(const ChunkerConfig& config, TextSplitterPtr text_splitter)
    : config_(config),
      splitter_factory_(config_, std::move(text_splitter)),
      context_extractor_(config_) {}

std::vector<Chunk> CodeChunker::chunk_file(const FileRecord& file,
                                           const std::string& scope_id) const {
  if (is_blank(file.content)) {
    if (config_.verbose_logging) {
      std::cout << "[CodeChunker] Skipping empty file: " << file.path << std::endl;
    }
    return {};
  }

  try {
    const FragmentSplitter& splitter = splitter_factory_.get_splitter_for(file);
    std::vector<std::string> fragments = splitter.split(file);

    if (fragments.empty()) {
      if (config_.verbose_logging) {
        std::cout << "[CodeChunker] Single chunk created: " << file.path << std::endl;
      }
      return create_single_chunk(file, scope_id);
    }

    std::vector<Chunk> chunks;
    chunks.reserve(fragments.size());
    for (size_t i = 0; i < fragments.size(); ++i) {
      chunks.push_back(create_chunk(file, scope_id, i, fragments[i]));
    }

    if (config_.verbose_logging) {
      std::cout << "[CodeChunker] Chunked " << file.path << " with " << splitter.name()
                << " splitter: " << chunks.size() << " chunks created" << std::endl;
    }
    return chunks;
  } catch (const std::exception& e) {
    std::cerr << "[CodeChunker] Failed to chunk file " << file.path << ": " << e.what()
              << std::endl;
    return create_single_chunk(file, scope_id, false);
  }
}

Chunk CodeChunker::create_chunk(const FileRecord& file,
                                const std::string& scope_id,
                                size_t index,
                                const std::string& text) const {
  Chunk chunk;
  chunk.id = make_chunk_id(scope_id, file.path, index);
  chunk.file_path = file.path;
  chunk.content = "File: " + file.path + "\n\n" + text;
  chunk.language = file.language;
  chunk.metadata = context_extractor_.extract(text, file.language);
  return chunk;
}

std::vector<Chunk> CodeChunker::create_single_chunk(const FileRecord& file,
                                                    const std::string& scope_id,
                                                    bool detect_context) const {
  if (detect_context) {
    return {create_chunk(file, scope_id, 0, file.content)};
  }

  // Fallback after a failure: no pattern matching at all
  Chunk chunk;
  chunk.id = make_chunk_id(scope_id, file.path, 0);
  chunk.file_path = file.path;
  chunk.content = "File: " + file.path + "\n\n" + file.content;
  chunk.language = file.language;
  return {chunk};
}

std::vector<std::string> CodeChunker::get_supported_languages() const {
  std::vector<std::string> languages;
  for (SplitterLanguage language : all_splitter_languages()) {
    languages.push_back(to_string(language));
  }
  return languages;
}

nlohmann::json CodeChunker::get_chunk_stats() const {
  std::vector<std::string> languages = get_supported_languages();
  nlohmann::json config_json = config_.to_json();
  return {{"supported_languages", languages.size()},
          {"language_list", languages},
          {"dynamic_sizing_enabled", config_.enable_dynamic_sizing},
          {"structural_language", config_.structural_language},
          {"size_tiers", config_json["size_tiers"]}};
}

}  // namespace codechunk_core
