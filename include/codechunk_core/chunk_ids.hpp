#pragma once

#include <cstddef>
#include <string>

namespace codechunk_core {

// Chunk id: "repo_<scope>_<path>_<index>"
std::string make_chunk_id(const std::string& scope_id, const std::string& file_path, size_t index);

// Search-index document id:
// "repo_<scope>_<file name with '.' as '_'>_<index>_<10 hex chars of md5>"
// @throw ChunkingError if the digest cannot be computed
std::string make_document_id(const std::string& scope_id,
                             const std::string& file_path,
                             size_t index);

// SHA-256 of the content as lowercase hex
// @throw ChunkingError if the digest cannot be computed
std::string compute_content_hash(const std::string& content);

}  // namespace codechunk_core
