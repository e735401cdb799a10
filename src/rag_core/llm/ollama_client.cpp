#include "rag_core/llm/ollama_client.hpp"
#include "ollama.hpp"

#include "rag_core/errors.hpp"

namespace rag_core {

OllamaClient::OllamaClient(const std::string& ollama_url,
                           const std::string& embedding_model,
                           const std::string& llm_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), llm_model_(llm_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw GenerationError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<std::vector<float>> OllamaClient::encode(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto& text : texts) {
    vectors.push_back(get_embedding(text));
  }
  return vectors;
}

std::vector<float> OllamaClient::get_embedding(const std::string& text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw EmbeddingError("Response does not contain embedding field");
    }

    // The endpoint answers with an array of vectors, older servers with a single vector
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingError("Embeddings field is not an array");
    }
    std::vector<float> embedding;
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      embedding = embeddings[0].get<std::vector<float>>();
    } else {
      embedding = embeddings.get<std::vector<float>>();
    }
    if (embedding.empty()) {
      throw EmbeddingError("Model " + embedding_model_ + " returned an empty embedding");
    }
    return embedding;

  } catch (const ollama::exception& e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }
}

bool OllamaClient::generate_stream(const std::string& prompt,
                                   const GenerationOptions& options,
                                   const FragmentCallback& on_fragment) {
  ollama::options request_options;
  request_options["temperature"] = options.temperature;
  request_options["num_predict"] = options.max_tokens;

  bool cancelled = false;
  auto on_receive = [&](const ollama::response& response) {
    if (cancelled) {
      return false;
    }
    std::string fragment = response.as_simple_string();
    if (!fragment.empty() && !on_fragment(fragment)) {
      cancelled = true;
    }
    return !cancelled;
  };

  try {
    ollama::generate(llm_model_, prompt, on_receive, request_options);
  } catch (const ollama::exception& e) {
    throw GenerationError("Text generation failed: " + std::string(e.what()));
  }
  return !cancelled;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace rag_core
