#include "rag_cli/cli_handler.hpp"

#include <utf8.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>  // Required for std::fixed and std::setprecision
#include <iostream>
#include <vector>

namespace rag_cli {

namespace {

const char* const kDefaultConfigFile = "ragrc.json";
const size_t kPreviewCodePoints = 200;

std::string trim(const std::string& text) {
  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string preview(const std::string& content) {
  auto it = content.begin();
  size_t count = 0;
  while (it != content.end() && count < kPreviewCodePoints) {
    utf8::next(it, content.end());
    ++count;
  }
  std::string out(content.begin(), it);
  if (it != content.end()) {
    out += "...";
  }
  return out;
}

Command parse_command(const std::string& command) {
  if (command == "index" || command == "i")
    return Command::Index;
  if (command == "search" || command == "s")
    return Command::Search;
  if (command == "ask" || command == "a")
    return Command::Ask;
  if (command == "chat" || command == "c")
    return Command::Chat;
  if (command == "stats")
    return Command::Stats;
  if (command == "help" || command == "h" || command == "--help" || command == "-h")
    return Command::Help;
  throw CliError("Unknown command: " + command);
}

}  // namespace

CliHandler::CliHandler(const Config& config,
                       std::shared_ptr<rag_core::Embedder> embedder,
                       std::shared_ptr<rag_core::TextGenerator> generator)
    : config_(config) {
  index_ = std::make_shared<rag_core::VectorIndex>(config_.index_config());
  retriever_ =
      std::make_shared<rag_core::Retriever>(std::move(embedder), index_, config_.retriever_config());
  extractor_ = std::make_shared<rag_core::MarkdownExtractor>(config_.chunker_config());
  indexing_service_ = std::make_shared<rag_core::IndexingService>(
      extractor_, retriever_, static_cast<size_t>(config_.max_documents));
  chat_service_ =
      std::make_shared<rag_core::ChatService>(retriever_, std::move(generator), config_.chat_config());
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  bool has_command = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      options.command = Command::Help;
      has_command = true;
      continue;
    }

    if (!arg.empty() && arg[0] == '-') {
      if (i + 1 >= argc) {
        throw CliError("Missing value for " + arg);
      }
      std::string value = argv[++i];

      if (arg == "--config" || arg == "-c") {
        options.config_path = value;
      } else if (arg == "--query" || arg == "-q") {
        options.query = value;
      } else if (arg == "--top-k" || arg == "-k") {
        try {
          options.top_k = std::stoi(value);
        } catch (const std::exception&) {
          throw CliError("Invalid value for --top-k: " + value);
        }
        if (*options.top_k <= 0) {
          throw CliError("--top-k must be greater than 0");
        }
      } else if (arg == "--threshold" || arg == "-t") {
        try {
          options.threshold = std::stof(value);
        } catch (const std::exception&) {
          throw CliError("Invalid value for --threshold: " + value);
        }
        if (*options.threshold < 0.0f || *options.threshold > 1.0f) {
          throw CliError("--threshold must be between 0 and 1");
        }
      } else {
        throw CliError("Unknown option: " + arg);
      }
      continue;
    }

    if (!has_command) {
      options.command = parse_command(arg);
      has_command = true;
    } else {
      positional.push_back(arg);
    }
  }

  // `ask what is x` works as well as `ask --query "what is x"`
  if (options.query.empty() && !positional.empty()) {
    for (const auto& word : positional) {
      if (!options.query.empty()) {
        options.query += ' ';
      }
      options.query += word;
    }
  }

  if ((options.command == Command::Search || options.command == Command::Ask) &&
      trim(options.query).empty()) {
    throw CliError("This command requires a query. Usage: search --query <query>");
  }

  return options;
}

std::string CliHandler::resolve_config_path(const CliOptions& options) {
  if (!options.config_path.empty()) {
    return options.config_path;
  }
  const char* env_path = std::getenv("RAG_CONFIG");
  if (env_path != nullptr && env_path[0] != '\0') {
    return env_path;
  }
  return kDefaultConfigFile;
}

Config CliHandler::load_config(const CliOptions& options) {
  std::string path = resolve_config_path(options);
  if (path == kDefaultConfigFile && !std::filesystem::exists(path)) {
    return Config::from_json(nlohmann::json::object());
  }
  return Config::from_file(path);
}

void CliHandler::set_cancel_flag(std::atomic<bool>* cancel) {
  cancel_ = cancel;
}

void CliHandler::execute_command(const CliOptions& options) {
  switch (options.command) {
    case Command::Index:
      handle_index_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Chat:
      handle_chat_command(options);
      break;
    case Command::Stats:
      handle_stats_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_index_command(const CliOptions& options) {
  rag_core::IndexingSummary summary =
      indexing_service_->index_directory(config_.documents_path, config_.index_path);

  std::cout << "Indexed " << summary.documents << " documents into " << summary.chunks
            << " chunks" << std::endl;
  for (const auto& failed : summary.failed_documents) {
    std::cout << "  failed: " << failed << std::endl;
  }
  if (summary.saved) {
    std::cout << "Index saved to " << config_.index_path << std::endl;
  } else {
    throw CliError("Index was not saved to " + config_.index_path);
  }
}

void CliHandler::handle_search_command(const CliOptions& options) {
  if (!load_saved_index()) {
    return;
  }
  int top_k = options.top_k.value_or(config_.top_k);
  float threshold = options.threshold.value_or(config_.similarity_threshold);
  std::cout << "Search for: " << options.query << " (top_k: " << top_k
            << ", threshold: " << threshold << ")" << std::endl;

  print_search_results(retriever_->search(options.query, top_k, threshold));
}

void CliHandler::handle_ask_command(const CliOptions& options) {
  if (!load_saved_index()) {
    return;
  }
  answer_question(options.query);
}

void CliHandler::handle_stats_command(const CliOptions& options) {
  if (!load_saved_index()) {
    return;
  }
  print_stats();
}

void CliHandler::handle_chat_command(const CliOptions& options) {
  rag_core::IndexSource source =
      indexing_service_->load_or_build(config_.documents_path, config_.index_path);
  std::cout << "Knowledge base ready (" << rag_core::to_string(source) << ", "
            << index_->size() << " chunks). Type 'help' for commands, 'quit' to leave."
            << std::endl;

  std::string line;
  while (true) {
    std::cout << "\n> " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << std::endl;
      break;
    }
    std::string input = trim(line);
    if (input.empty()) {
      continue;
    }
    if (input == "quit" || input == "exit" || input == "退出") {
      break;
    }
    if (input == "help" || input == "帮助") {
      print_help();
      continue;
    }
    if (input == "stats" || input == "统计") {
      print_stats();
      continue;
    }
    answer_question(input);
  }
  std::cout << "Bye." << std::endl;
}

bool CliHandler::load_saved_index() {
  if (retriever_->load_index(config_.index_path)) {
    return true;
  }
  std::cerr << "No index found at " << config_.index_path
            << ". Run 'rag_cli index' to build one." << std::endl;
  return false;
}

void CliHandler::answer_question(const std::string& question) {
  if (cancel_ != nullptr) {
    cancel_->store(false);
  }

  std::vector<std::string> sources;
  float confidence = 0.0f;
  chat_service_->generate_answer_stream(
      question,
      [&](const rag_core::ChatEvent& event) {
        switch (event.type) {
          case rag_core::ChatEventType::Start:
            sources = event.sources;
            confidence = event.confidence;
            break;
          case rag_core::ChatEventType::Chunk:
            std::cout << event.content << std::flush;
            break;
          case rag_core::ChatEventType::End:
            std::cout << "\n\nSources: ";
            for (size_t i = 0; i < sources.size(); ++i) {
              std::cout << (i > 0 ? ", " : "") << sources[i];
            }
            std::cout << "\nConfidence: " << std::fixed << std::setprecision(2) << confidence
                      << "\nResponse time: " << event.response_time << "s" << std::endl;
            std::cout.unsetf(std::ios::floatfield);
            break;
          case rag_core::ChatEventType::Error:
            std::cout << "\n" << event.content << std::endl;
            std::cerr << "Error: " << event.error << std::endl;
            break;
        }
      },
      cancel_);
}

void CliHandler::print_search_results(const std::vector<rag_core::QueryResult>& results) {
  if (results.empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }

  for (size_t i = 0; i < results.size(); ++i) {
    const auto& result = results[i];
    std::cout << "\n" << (i + 1) << ". " << result.source_file << " #" << result.chunk_index
              << "  (score: " << std::fixed << std::setprecision(4) << result.score << ")"
              << std::endl;
    std::cout.unsetf(std::ios::floatfield);
    auto heading = result.metadata.find("heading_path");
    if (heading != result.metadata.end() && heading->is_string() &&
        !heading->get<std::string>().empty()) {
      std::cout << "   " << heading->get<std::string>() << std::endl;
    }
    std::cout << "   " << preview(result.content) << std::endl;
  }
}

void CliHandler::print_stats() {
  rag_core::RetrieverStats stats = retriever_->get_stats();
  std::cout << "Index statistics:" << "\n"
            << "  type:          " << stats.index.index_type << "\n"
            << "  vectors:       " << stats.index.total_vectors << "\n"
            << "  dimension:     " << stats.index.dimension << "\n"
            << "  size (bytes):  " << stats.index.index_size_bytes << "\n"
            << "  trained:       " << (stats.index.is_trained ? "yes" : "no") << "\n"
            << "  ready:         " << (stats.ready ? "yes" : "no") << std::endl;
}

void CliHandler::print_help() {
  std::cout << R"(
RAG Assistant CLI - Question answering over local Markdown documents

Usage: rag_cli [--config <path>] <command> [options]

Commands:
  index, i      Index all Markdown files in the documents directory
  search, s     Search the index
                  --query, -q <text>      Query text (required)
                  --top-k, -k <n>         Number of results
                  --threshold, -t <x>     Minimum similarity in [0, 1] (0 disables filtering)
  ask, a        Answer one question: ask --query <text>
  chat, c       Interactive question answering (default)
  stats         Show index statistics
  help, h       Show this help

Global options:
  --config, -c <path>   Config file (default: $RAG_CONFIG, then ragrc.json)

Chat commands:
  quit, exit, 退出      Leave the chat
  help, 帮助            Show this help
  stats, 统计           Show index statistics
)" << std::endl;
}

}  // namespace rag_cli
