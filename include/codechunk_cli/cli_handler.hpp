#pragma once

#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "codechunk_core/chunking/code_chunker.hpp"
#include "codechunk_core/types.hpp"

namespace codechunk_cli
{

  enum class Command
  {
    Chunk,
    Languages,
    Stats,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string language;  // detected from the path when empty
    std::string scope_id = "0";
    std::string config_path;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::ostream &out = std::cout);

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Read a local file into a record, detecting its language when none is given
    static codechunk_core::FileRecord load_file_record(const std::string &file_path,
                                                       const std::string &language);

    // Chunk a record and describe the result as JSON
    static nlohmann::json chunk_record(const codechunk_core::CodeChunker &chunker,
                                       const codechunk_core::FileRecord &record,
                                       const std::string &scope_id);

  private:
    std::ostream &out_;

    // Command handlers
    void handle_chunk_command(const CliOptions &options);
    void handle_languages_command(const CliOptions &options);
    void handle_stats_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // Helper methods
    static codechunk_core::ChunkerConfig load_config(const CliOptions &options);
    void print_json_response(const nlohmann::json &response);
    void print_help();
  };

}
