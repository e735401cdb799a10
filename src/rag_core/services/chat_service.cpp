#include "rag_core/services/chat_service.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

const char* const kNoResultsMessage =
    "Sorry, I could not find anything in the knowledge base that answers your question.";
const char* const kFailureMessage =
    "Sorry, something went wrong while answering your question. Please try again later.";

std::string source_of(const QueryResult& result) {
  if (result.metadata.is_object()) {
    auto it = result.metadata.find("file_name");
    if (it != result.metadata.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  if (!result.source_file.empty()) {
    return result.source_file;
  }
  return "unknown source";
}

bool is_cancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load();
}

}  // namespace

std::string to_string(ChatEventType type) {
  switch (type) {
    case ChatEventType::Start:
      return "start";
    case ChatEventType::Chunk:
      return "chunk";
    case ChatEventType::End:
      return "end";
    case ChatEventType::Error:
      return "error";
    default:
      return "unknown";
  }
}

ChatService::ChatService(std::shared_ptr<Retriever> retriever,
                         std::shared_ptr<TextGenerator> generator,
                         const ChatConfig& config)
    : retriever_(std::move(retriever)), generator_(std::move(generator)), config_(config) {
  if (!retriever_ || !generator_) {
    throw ConfigurationError("ChatService requires a retriever and a text generator");
  }
  if (config_.top_k <= 0) {
    throw ConfigurationError("top_k must be greater than 0");
  }
  if (config_.similarity_threshold < 0.0f || config_.similarity_threshold > 1.0f) {
    throw ConfigurationError("similarity_threshold must be between 0 and 1");
  }
  if (config_.max_retries <= 0) {
    throw ConfigurationError("max_retries must be at least 1");
  }
  if (config_.retry_delay_ms < 0) {
    throw ConfigurationError("retry_delay_ms must not be negative");
  }
}

std::string ChatService::build_prompt(const std::string& question, const std::string& context) {
  return "You are a knowledgeable assistant. Answer the user's question using the knowledge base "
         "content below.\n"
         "\n"
         "Knowledge base content:\n" +
         context +
         "\n"
         "\n"
         "User question: " +
         question +
         "\n"
         "\n"
         "Follow these rules:\n"
         "1. Answer only from the knowledge base content above.\n"
         "2. If the knowledge base does not contain the answer, say so clearly.\n"
         "3. Be accurate, detailed and well organised.\n"
         "4. Answer in the language the question was asked in.\n"
         "5. Give concrete examples or explanations where possible.\n"
         "\n"
         "Answer:";
}

void ChatService::generate_answer_stream(const std::string& question,
                                         const ChatEventCallback& on_event,
                                         const std::atomic<bool>* cancel) const {
  const auto start_time = std::chrono::steady_clock::now();
  auto elapsed_seconds = [&start_time]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
  };
  auto emit_error = [&on_event](const std::string& error, const std::string& content) {
    ChatEvent event{ChatEventType::Error};
    event.error = error;
    event.content = content;
    on_event(event);
  };

  // 1. Retrieve
  std::vector<QueryResult> results =
      retriever_->search_with_status(question, config_.top_k, config_.similarity_threshold);
  if (results.size() == 1 && results.front().status == QueryStatus::Error) {
    emit_error("Retrieval failed: " + results.front().error_msg, kFailureMessage);
    return;
  }
  if (results.empty()) {
    std::cerr << "Warning: No relevant documents found for question" << std::endl;
    emit_error("No relevant documents found", kNoResultsMessage);
    return;
  }

  // 2. Context, sources and confidence
  std::string context;
  ChatEvent start_event{ChatEventType::Start};
  float score_sum = 0.0f;
  for (const auto& result : results) {
    if (!context.empty()) {
      context += "\n\n";
    }
    context += result.content;
    std::string source = source_of(result);
    if (std::find(start_event.sources.begin(), start_event.sources.end(), source) ==
        start_event.sources.end()) {
      start_event.sources.push_back(source);
    }
    score_sum += result.score;
  }
  start_event.confidence = score_sum / static_cast<float>(results.size());
  on_event(start_event);

  // 3. Stream the answer
  const std::string prompt = build_prompt(question, context);
  bool streamed = false;
  auto on_fragment = [&](const std::string& fragment) {
    if (is_cancelled(cancel)) {
      return false;
    }
    streamed = true;
    ChatEvent chunk_event{ChatEventType::Chunk};
    chunk_event.content = fragment;
    on_event(chunk_event);
    return !is_cancelled(cancel);
  };

  for (int attempt = 1; attempt <= config_.max_retries && !is_cancelled(cancel); ++attempt) {
    try {
      generator_->generate_stream(prompt, config_.generation, on_fragment);
      break;
    } catch (const GenerationError& e) {
      std::cerr << "Warning: Generation failed (attempt " << attempt << "/" << config_.max_retries
                << "): " << e.what() << std::endl;
      // Retrying after text has been shown would duplicate it.
      if (streamed || attempt == config_.max_retries) {
        emit_error("Generation failed: " + std::string(e.what()), kFailureMessage);
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_delay_ms * attempt));
    }
  }

  ChatEvent end_event{ChatEventType::End};
  end_event.response_time = elapsed_seconds();
  on_event(end_event);
}

}  // namespace rag_core
