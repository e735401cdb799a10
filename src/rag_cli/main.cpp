#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include "rag_cli/cli_handler.hpp"
#include "rag_core/llm/ollama_client.hpp"

namespace {

std::atomic<bool> g_cancel_answer{false};

void handle_interrupt(int) {
  g_cancel_answer.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    // Parse command line arguments
    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == rag_cli::Command::Help) {
      rag_cli::CliHandler::print_help();
      return 0;
    }

    rag_cli::Config config = rag_cli::CliHandler::load_config(options);

    auto ollama_client = std::make_shared<rag_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.llm_model);

    rag_cli::CliHandler handler(config, ollama_client, ollama_client);
    if (options.command == rag_cli::Command::Chat || options.command == rag_cli::Command::Ask) {
      // Ctrl-C stops the answer being streamed; Ctrl-D leaves the chat.
      std::signal(SIGINT, handle_interrupt);
      handler.set_cancel_flag(&g_cancel_answer);
    }

    // Execute the command
    handler.execute_command(options);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
