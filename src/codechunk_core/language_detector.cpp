#include "codechunk_core/language_detector.hpp"

#include <algorithm>
#include <cctype>

namespace codechunk_core {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), ::tolower);
  return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string file_name_of(const std::string& file_path) {
  return file_path.substr(file_path.find_last_of('/') + 1);
}

}  // namespace

const std::vector<std::pair<std::string, std::vector<std::string>>>& language_extensions() {
  static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
      {"bash", {".sh", ".bash", ".zsh"}},
      {"c", {".c", ".h"}},
      {"cpp", {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx", ".C", ".H"}},
      {"c_sharp", {".cs", ".csx"}},
      {"css", {".css"}},
      {"go", {".go"}},
      {"html", {".html", ".htm"}},
      {"java", {".java"}},
      {"javascript", {".js", ".jsx", ".mjs", ".cjs"}},
      {"json", {".json"}},
      {"php", {".php", ".phtml"}},
      {"python", {".py", ".pyw"}},
      {"ruby", {".rb", ".rake", ".gemspec"}},
      {"rust", {".rs"}},
      {"typescript", {".ts", ".tsx"}},
      {"elixir", {".ex", ".exs"}},
      {"elm", {".elm"}},
      {"erlang", {".erl", ".hrl"}},
      {"fortran", {".f90", ".f95", ".f03"}},
      {"hack", {".hack", ".hhi"}},
      {"haskell", {".hs", ".lhs"}},
      {"hcl", {".hcl", ".tf"}},
      {"julia", {".jl"}},
      {"kotlin", {".kt", ".kts"}},
      {"lua", {".lua"}},
      {"make", {"Makefile", ".mk", ".make"}},
      {"markdown", {".md", ".markdown"}},
      {"ocaml", {".ml", ".mli"}},
      {"perl", {".pl", ".pm"}},
      {"ql", {".ql", ".qll"}},
      {"regex", {".regex"}},
      {"rst", {".rst"}},
      {"scala", {".scala", ".sc"}},
      {"sql", {".sql"}},
      {"toml", {".toml"}},
      {"yaml", {".yaml", ".yml"}},
      {"dockerfile", {"Dockerfile", ".dockerfile"}},
      {"elisp", {".el"}},
      {"objc", {".m", ".mm"}},
      {"swift", {".swift"}},
      {"vue", {".vue"}},
      {"svelte", {".svelte"}},
  };
  return table;
}

std::string detect_language(const std::string& file_path) {
  const std::string lowered_path = to_lower(file_path);
  const std::string lowered_name = to_lower(file_name_of(file_path));

  for (const auto& [language, patterns] : language_extensions()) {
    for (const auto& pattern : patterns) {
      if (pattern.front() == '.') {
        if (ends_with(lowered_path, to_lower(pattern))) {
          return language;
        }
      } else if (lowered_name == to_lower(pattern)) {
        return language;
      }
    }
  }
  return "unknown";
}

bool is_supported_source(const std::string& file_path) {
  if (file_path.empty() || file_path.front() == '.' || file_path.find("/.") != std::string::npos) {
    return false;
  }
  return detect_language(file_path) != "unknown";
}

std::string file_category(const std::string& file_path, const std::string& language) {
  if (language != "unknown") {
    return "CODE";
  }

  const std::string file_name = file_name_of(file_path);
  size_t dot = file_name.find_last_of('.');
  if (dot == std::string::npos) {
    return "." + to_lower(file_name);
  }
  return "." + to_lower(file_name.substr(dot + 1));
}

}  // namespace codechunk_core
