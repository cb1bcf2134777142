#include "codechunk_cli/cli_handler.hpp"

#include <fstream>
#include <sstream>

#include "codechunk_core/chunk_ids.hpp"
#include "codechunk_core/language_detector.hpp"

namespace codechunk_cli {

CliHandler::CliHandler(std::ostream& out) : out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "chunk" || command == "c") {
        options.command = Command::Chunk;
        if (argc < 4) {
            throw CliError("Chunk command requires a file path. Usage: chunk --file <path>");
        }
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) {
                throw CliError("Missing value for flag: " + std::string(argv[i]));
            }
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            } else if (flag == "--language" || flag == "-l") {
                options.language = value;
            } else if (flag == "--scope" || flag == "-s") {
                options.scope_id = value;
            } else if (flag == "--config" || flag == "-c") {
                options.config_path = value;
            } else {
                throw CliError("Unknown flag for chunk command: " + flag);
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Chunk command requires a file path. Usage: chunk --file <path>");
        }
    } else if (command == "languages" || command == "l") {
        options.command = Command::Languages;
    } else if (command == "stats") {
        options.command = Command::Stats;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--config" || flag == "-c") {
                options.config_path = value;
            }
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Chunk:
            handle_chunk_command(options);
            break;
        case Command::Languages:
            handle_languages_command(options);
            break;
        case Command::Stats:
            handle_stats_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

codechunk_core::FileRecord CliHandler::load_file_record(const std::string& file_path,
                                                        const std::string& language) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        throw CliError("Could not open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file_stream.rdbuf();

    codechunk_core::FileRecord record;
    record.path = file_path;
    record.content = buffer.str();
    record.language = language.empty() ? codechunk_core::detect_language(file_path) : language;
    record.size = record.content.size();
    return record;
}

nlohmann::json CliHandler::chunk_record(const codechunk_core::CodeChunker& chunker,
                                        const codechunk_core::FileRecord& record,
                                        const std::string& scope_id) {
    std::vector<codechunk_core::Chunk> chunks = chunker.chunk_file(record, scope_id);

    nlohmann::json chunk_list = nlohmann::json::array();
    for (size_t i = 0; i < chunks.size(); ++i) {
        nlohmann::json chunk_json = chunks[i];
        chunk_json["document_id"] = codechunk_core::make_document_id(scope_id, record.path, i);
        chunk_list.push_back(chunk_json);
    }

    return {{"file_path", record.path},
            {"language", record.language},
            {"category", codechunk_core::file_category(record.path, record.language)},
            {"size", record.size},
            {"content_hash", codechunk_core::compute_content_hash(record.content)},
            {"chunk_count", chunks.size()},
            {"chunks", chunk_list}};
}

void CliHandler::handle_chunk_command(const CliOptions& options) {
    codechunk_core::CodeChunker chunker(load_config(options));
    codechunk_core::FileRecord record = load_file_record(options.file_path, options.language);
    print_json_response(chunk_record(chunker, record, options.scope_id));
}

void CliHandler::handle_languages_command(const CliOptions& options) {
    codechunk_core::CodeChunker chunker(load_config(options));
    print_json_response(chunker.get_supported_languages());
}

void CliHandler::handle_stats_command(const CliOptions& options) {
    codechunk_core::CodeChunker chunker(load_config(options));
    print_json_response(chunker.get_chunk_stats());
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

codechunk_core::ChunkerConfig CliHandler::load_config(const CliOptions& options) {
    if (options.config_path.empty()) {
        return codechunk_core::ChunkerConfig{};
    }
    return codechunk_core::ChunkerConfig::from_file(options.config_path);
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    // Invalid UTF-8 in file content is printed as U+FFFD
    out_ << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void CliHandler::print_help() {
    out_ << "Code Chunker CLI\n"
         << "\n"
         << "Usage: codechunk_cli <command> [options]\n"
         << "\n"
         << "Commands:\n"
         << "  chunk, c        Split a source file into chunks and print them as JSON\n"
         << "                  --file, -f <path>       File to chunk (required)\n"
         << "                  --language, -l <tag>    Language tag (detected from the path if omitted)\n"
         << "                  --scope, -s <id>        Repository scope id (default: 0)\n"
         << "                  --config, -c <path>     JSON chunker configuration\n"
         << "  languages, l    List languages with dedicated separators\n"
         << "  stats           Print the active chunker configuration\n"
         << "                  --config, -c <path>     JSON chunker configuration\n"
         << "  help, h         Show this help message\n";
}

}  // namespace codechunk_cli
