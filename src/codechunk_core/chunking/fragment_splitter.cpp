#include "codechunk_core/chunking/fragment_splitter.hpp"

namespace codechunk_core {

std::string FragmentSplitter::trim_trailing_whitespace(const std::string& text) {
  size_t end = text.find_last_not_of(" \t\r\n\f\v");
  if (end == std::string::npos) {
    return "";
  }
  return text.substr(0, end + 1);
}

}  // namespace codechunk_core
