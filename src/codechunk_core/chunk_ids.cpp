#include "codechunk_core/chunk_ids.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "codechunk_core/chunking/fragment_splitter.hpp"

namespace codechunk_core {

namespace {

std::string hex_digest(const EVP_MD* digest, const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ChunkingError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, digest, nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ChunkingError("Failed to initialize digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ChunkingError("Failed to update digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ChunkingError("Failed to finalize digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string make_chunk_id(const std::string& scope_id, const std::string& file_path, size_t index) {
  return "repo_" + scope_id + "_" + file_path + "_" + std::to_string(index);
}

std::string make_document_id(const std::string& scope_id,
                             const std::string& file_path,
                             size_t index) {
  const std::string unique_key = scope_id + "_" + file_path + "_" + std::to_string(index);
  const std::string hash_suffix = hex_digest(EVP_md5(), unique_key).substr(0, 10);

  std::string safe_name = file_path.substr(file_path.find_last_of('/') + 1);
  std::replace(safe_name.begin(), safe_name.end(), '.', '_');

  return "repo_" + scope_id + "_" + safe_name + "_" + std::to_string(index) + "_" + hash_suffix;
}

std::string compute_content_hash(const std::string& content) {
  return hex_digest(EVP_sha256(), content);
}

}  // namespace codechunk_core
