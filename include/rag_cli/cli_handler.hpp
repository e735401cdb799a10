#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "rag_cli/config.hpp"
#include "rag_core/extractors/markdown_extractor.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedder.hpp"
#include "rag_core/llm/text_generator.hpp"
#include "rag_core/services/chat_service.hpp"
#include "rag_core/services/indexing_service.hpp"
#include "rag_core/services/retriever.hpp"

namespace rag_cli {

enum class Command { Index, Search, Ask, Chat, Stats, Help };

struct CliOptions {
  Command command = Command::Chat;
  std::string config_path;
  std::string query;
  std::optional<int> top_k;
  std::optional<float> threshold;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  CliHandler(const Config& config,
             std::shared_ptr<rag_core::Embedder> embedder,
             std::shared_ptr<rag_core::TextGenerator> generator);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler&) = delete;
  CliHandler& operator=(const CliHandler&) = delete;

  // Parse command line arguments
  static CliOptions parse_arguments(int argc, char* argv[]);

  // --config, else $RAG_CONFIG, else ragrc.json in the working directory
  static std::string resolve_config_path(const CliOptions& options);

  // A missing default file yields the defaults; a missing explicit file is an error.
  static Config load_config(const CliOptions& options);

  static void print_help();

  // Execute command
  void execute_command(const CliOptions& options);

  // Set while an answer is streaming to stop it early.
  void set_cancel_flag(std::atomic<bool>* cancel);

 private:
  Config config_;
  std::shared_ptr<rag_core::VectorIndex> index_;
  std::shared_ptr<rag_core::Retriever> retriever_;
  std::shared_ptr<rag_core::MarkdownExtractor> extractor_;
  std::shared_ptr<rag_core::IndexingService> indexing_service_;
  std::shared_ptr<rag_core::ChatService> chat_service_;
  std::atomic<bool>* cancel_ = nullptr;

  // Command handlers
  void handle_index_command(const CliOptions& options);
  void handle_search_command(const CliOptions& options);
  void handle_ask_command(const CliOptions& options);
  void handle_chat_command(const CliOptions& options);
  void handle_stats_command(const CliOptions& options);

  // Helper methods
  bool load_saved_index();
  void answer_question(const std::string& question);
  void print_search_results(const std::vector<rag_core::QueryResult>& results);
  void print_stats();
};

}  // namespace rag_cli
