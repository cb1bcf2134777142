#include "codechunk_core/types.hpp"

#include <algorithm>
#include <cctype>

namespace codechunk_core {

std::string to_string(LanguageFamily family) {
  switch (family) {
    case LanguageFamily::Python:
      return "Python";
    case LanguageFamily::JavaScript:
      return "JavaScript";
    case LanguageFamily::JavaLike:
      return "JavaLike";
    case LanguageFamily::Go:
      return "Go";
    case LanguageFamily::Rust:
      return "Rust";
    case LanguageFamily::CFamily:
      return "CFamily";
    default:
      return "Unrecognized";
  }
}

LanguageFamily language_family_from_string(const std::string& language) {
  std::string tag = language;
  std::transform(tag.begin(), tag.end(), tag.begin(), ::tolower);

  if (tag == "python")
    return LanguageFamily::Python;
  if (tag == "javascript" || tag == "typescript")
    return LanguageFamily::JavaScript;
  if (tag == "java" || tag == "kotlin" || tag == "c_sharp")
    return LanguageFamily::JavaLike;
  if (tag == "go")
    return LanguageFamily::Go;
  if (tag == "rust")
    return LanguageFamily::Rust;
  if (tag == "c" || tag == "cpp")
    return LanguageFamily::CFamily;
  return LanguageFamily::Unrecognized;
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

bool operator==(const ChunkMetadata& lhs, const ChunkMetadata& rhs) {
  return lhs.class_name == rhs.class_name && lhs.function_name == rhs.function_name;
}

bool operator==(const Chunk& lhs, const Chunk& rhs) {
  return lhs.id == rhs.id && lhs.file_path == rhs.file_path && lhs.content == rhs.content &&
         lhs.language == rhs.language && lhs.metadata == rhs.metadata;
}

void to_json(nlohmann::json& j, const ChunkMetadata& metadata) {
  j = nlohmann::json::object();
  if (metadata.class_name) {
    j["class_name"] = *metadata.class_name;
  }
  if (metadata.function_name) {
    j["function_name"] = *metadata.function_name;
  }
}

void to_json(nlohmann::json& j, const Chunk& chunk) {
  j = nlohmann::json{{"chunk_id", chunk.id},
                     {"file_path", chunk.file_path},
                     {"content", chunk.content},
                     {"language", chunk.language},
                     {"metadata", chunk.metadata}};
}

}  // namespace codechunk_core
