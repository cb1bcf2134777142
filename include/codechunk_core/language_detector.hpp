#pragma once

#include <string>
#include <utility>
#include <vector>

namespace codechunk_core {

// Language tag → extensions (".py") or exact file names ("Makefile"), in lookup order
const std::vector<std::pair<std::string, std::vector<std::string>>>& language_extensions();

// Language tag for a repo-relative path, "unknown" if nothing matches.
// Extensions and file names are compared case-insensitively.
std::string detect_language(const std::string& file_path);

// False for hidden paths and paths of unknown language
bool is_supported_source(const std::string& file_path);

// "CODE" for known languages, otherwise the lowercase ".ext" (or the lowercase
// file name when it has no dot)
std::string file_category(const std::string& file_path, const std::string& language);

}  // namespace codechunk_core
