#pragma once

#include <string>
#include <vector>

#include "rag_core/llm/embedder.hpp"
#include "rag_core/llm/text_generator.hpp"

namespace rag_core {

class OllamaClient : public Embedder, public TextGenerator {
 public:
  /**
   * @throw GenerationError if no Ollama server answers at ollama_url.
   */
  OllamaClient(const std::string& ollama_url,
               const std::string& embedding_model,
               const std::string& llm_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient&) = delete;
  OllamaClient& operator=(const OllamaClient&) = delete;

  std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) override;

  bool generate_stream(const std::string& prompt,
                       const GenerationOptions& options,
                       const FragmentCallback& on_fragment) override;

  std::vector<float> get_embedding(const std::string& text);
  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string llm_model_;

  void setup_server_connection();
};

}  // namespace rag_core
