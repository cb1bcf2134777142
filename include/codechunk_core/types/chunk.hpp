#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace codechunk_core {

// Structural context detected in a fragment. An unset field means "not detected";
// a set field is never empty.
struct ChunkMetadata {
  std::optional<std::string> class_name;
  std::optional<std::string> function_name;

  bool empty() const {
    return !class_name && !function_name;
  }
};

struct Chunk {
  std::string id;
  std::string file_path;
  std::string content;  // "File: <path>\n\n" + fragment
  std::string language;
  ChunkMetadata metadata;
};

bool operator==(const ChunkMetadata& lhs, const ChunkMetadata& rhs);
bool operator==(const Chunk& lhs, const Chunk& rhs);

void to_json(nlohmann::json& j, const ChunkMetadata& metadata);
void to_json(nlohmann::json& j, const Chunk& chunk);

}  // namespace codechunk_core
