#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/text_generator.hpp"
#include "rag_core/services/retriever.hpp"

namespace rag_core {

struct ChatConfig {
  int top_k = 5;
  float similarity_threshold = 0.3f;
  GenerationOptions generation;
  // Attempts made when the generator fails before producing any text.
  int max_retries = 3;
  int retry_delay_ms = 1000;
};

enum class ChatEventType { Start, Chunk, End, Error };

std::string to_string(ChatEventType type);

struct ChatEvent {
  ChatEventType type;
  std::string content;               // Chunk: fragment text. Error: message for the user.
  std::vector<std::string> sources;  // Start
  float confidence = 0.0f;           // Start: mean score of the retrieved chunks
  double response_time = 0.0;        // End: seconds since the question arrived
  std::string error;                 // Error
};

using ChatEventCallback = std::function<void(const ChatEvent&)>;

/**
 * @class ChatService
 * @brief Answers questions from the knowledge base: retrieve, build a prompt, stream the answer.
 */
class ChatService {
 public:
  ChatService(std::shared_ptr<Retriever> retriever,
              std::shared_ptr<TextGenerator> generator,
              const ChatConfig& config = {});

  /**
   * @brief Streams an answer as a sequence of events.
   *
   * A successful answer is Start, zero or more Chunk, End. When nothing relevant is found or
   * the backend fails, a single Error event ends the sequence (after any Chunk events already
   * sent). Setting *cancel stops the stream; End is still emitted.
   */
  void generate_answer_stream(const std::string& question,
                              const ChatEventCallback& on_event,
                              const std::atomic<bool>* cancel = nullptr) const;

  static std::string build_prompt(const std::string& question, const std::string& context);

 private:
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<TextGenerator> generator_;
  ChatConfig config_;
};

}  // namespace rag_core
