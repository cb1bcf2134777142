#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "codechunk_core/types/file_record.hpp"

namespace codechunk_core {

class ChunkingError : public std::exception {
 public:
  explicit ChunkingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class FragmentSplitter {
 public:
  virtual ~FragmentSplitter() = default;

  // Checks if this splitter applies to the given file
  virtual bool can_handle(const FileRecord& file) const = 0;

  // Splits the file content into ordered fragments, never returns an empty list
  // for non-blank content
  virtual std::vector<std::string> split(const FileRecord& file) const = 0;

  // Short name used in log lines
  virtual std::string name() const = 0;

 protected:
  static std::string trim_trailing_whitespace(const std::string& text);
};

using FragmentSplitterPtr = std::unique_ptr<FragmentSplitter>;

}  // namespace codechunk_core
