#pragma once

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/services/chat_service.hpp"
#include "rag_core/services/retriever.hpp"

namespace rag_cli {

class Config {
 public:
  // ollama
  std::string ollama_url;
  std::string embedding_model;
  std::string llm_model;

  // retrieval
  int chunk_size;
  int chunk_overlap;
  int top_k;
  float similarity_threshold;
  int candidate_multiplier;

  // embedding
  int batch_size;
  int max_in_flight_batches;

  // index
  std::string index_type;
  int hnsw_m;
  int hnsw_ef_construction;
  int hnsw_ef_search;

  // llm
  float temperature;
  int max_tokens;
  int max_retries;
  int retry_delay_ms;

  // paths
  std::string documents_path;
  std::string index_path;
  int max_documents;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw rag_core::ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw rag_core::ConfigurationError(std::string("Failed to parse JSON in config file '") +
                                         filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw rag_core::ConfigurationError("Config must be a JSON object");
    }

    Config config;
    try {
      const nlohmann::json ollama = section(json_config, "ollama");
      config.ollama_url = ollama.value("url", std::string("http://localhost:11434"));
      config.embedding_model = ollama.value("embedding_model", std::string("mxbai-embed-large"));
      config.llm_model = ollama.value("llm_model", std::string("llama3.1"));

      const nlohmann::json retrieval = section(json_config, "retrieval");
      config.chunk_size = retrieval.value("chunk_size", 500);
      config.chunk_overlap = retrieval.value("chunk_overlap", 50);
      config.top_k = retrieval.value("top_k", 5);
      config.similarity_threshold = retrieval.value("similarity_threshold", 0.3f);
      config.candidate_multiplier = retrieval.value("candidate_multiplier", 2);

      const nlohmann::json embedding = section(json_config, "embedding");
      config.batch_size = embedding.value("batch_size", 32);
      config.max_in_flight_batches = embedding.value("max_in_flight_batches", 1);

      const nlohmann::json index = section(json_config, "index");
      config.index_type = index.value("type", std::string("hnsw"));
      config.hnsw_m = index.value("hnsw_m", 32);
      config.hnsw_ef_construction = index.value("hnsw_ef_construction", 100);
      config.hnsw_ef_search = index.value("hnsw_ef_search", 64);

      const nlohmann::json llm = section(json_config, "llm");
      config.temperature = llm.value("temperature", 0.7f);
      config.max_tokens = llm.value("max_tokens", 1000);
      config.max_retries = llm.value("max_retries", 3);
      config.retry_delay_ms = llm.value("retry_delay_ms", 1000);

      const nlohmann::json paths = section(json_config, "paths");
      config.documents_path = paths.value("documents", std::string("./data/documents"));
      config.index_path = paths.value("index", std::string("./data/vectors/main_index.rag"));

      config.max_documents = json_config.value("max_documents", 100);
    } catch (const nlohmann::json::exception& e) {
      throw rag_core::ConfigurationError(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  rag_core::ChunkerConfig chunker_config() const {
    return {.chunk_size = chunk_size, .chunk_overlap = chunk_overlap};
  }

  rag_core::VectorIndexConfig index_config() const {
    rag_core::VectorIndexConfig index;
    index.kind = rag_core::index_kind_from_string(index_type);
    index.hnsw_m = hnsw_m;
    index.hnsw_ef_construction = hnsw_ef_construction;
    index.hnsw_ef_search = hnsw_ef_search;
    return index;
  }

  rag_core::RetrieverConfig retriever_config() const {
    return {.embedding_batch_size = batch_size,
            .max_in_flight_batches = max_in_flight_batches,
            .candidate_multiplier = candidate_multiplier,
            .default_top_k = top_k,
            .default_similarity_threshold = similarity_threshold};
  }

  rag_core::ChatConfig chat_config() const {
    return {.top_k = top_k,
            .similarity_threshold = similarity_threshold,
            .generation = {.temperature = temperature, .max_tokens = max_tokens},
            .max_retries = max_retries,
            .retry_delay_ms = retry_delay_ms};
  }

 private:
  static nlohmann::json section(const nlohmann::json& json_config, const char* name) {
    if (!json_config.contains(name)) {
      return nlohmann::json::object();
    }
    const nlohmann::json& value = json_config.at(name);
    if (!value.is_object()) {
      throw rag_core::ConfigurationError(std::string("Config section '") + name +
                                         "' must be an object");
    }
    return value;
  }

  void validate() const {
    if (ollama_url.empty()) {
      throw rag_core::ConfigurationError("ollama.url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw rag_core::ConfigurationError("ollama.embedding_model cannot be empty");
    }
    if (llm_model.empty()) {
      throw rag_core::ConfigurationError("ollama.llm_model cannot be empty");
    }
    if (chunk_size <= 0) {
      throw rag_core::ConfigurationError("retrieval.chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap > chunk_size) {
      throw rag_core::ConfigurationError("retrieval.chunk_overlap must be between 0 and chunk_size");
    }
    if (top_k <= 0) {
      throw rag_core::ConfigurationError("retrieval.top_k must be greater than 0");
    }
    if (similarity_threshold < 0.0f || similarity_threshold > 1.0f) {
      throw rag_core::ConfigurationError("retrieval.similarity_threshold must be between 0 and 1");
    }
    if (candidate_multiplier <= 0) {
      throw rag_core::ConfigurationError("retrieval.candidate_multiplier must be greater than 0");
    }
    if (batch_size <= 0) {
      throw rag_core::ConfigurationError("embedding.batch_size must be greater than 0");
    }
    if (max_in_flight_batches <= 0) {
      throw rag_core::ConfigurationError("embedding.max_in_flight_batches must be greater than 0");
    }
    if (index_type != "hnsw" && index_type != "flat") {
      throw rag_core::ConfigurationError("index.type must be \"hnsw\" or \"flat\"");
    }
    if (hnsw_m <= 0 || hnsw_ef_construction <= 0 || hnsw_ef_search <= 0) {
      throw rag_core::ConfigurationError("index HNSW parameters must be greater than 0");
    }
    if (temperature < 0.0f) {
      throw rag_core::ConfigurationError("llm.temperature cannot be negative");
    }
    if (max_tokens <= 0) {
      throw rag_core::ConfigurationError("llm.max_tokens must be greater than 0");
    }
    if (max_retries <= 0) {
      throw rag_core::ConfigurationError("llm.max_retries must be at least 1");
    }
    if (retry_delay_ms < 0) {
      throw rag_core::ConfigurationError("llm.retry_delay_ms cannot be negative");
    }
    if (documents_path.empty() || index_path.empty()) {
      throw rag_core::ConfigurationError("paths.documents and paths.index cannot be empty");
    }
    if (max_documents <= 0) {
      throw rag_core::ConfigurationError("max_documents must be greater than 0");
    }
  }
};

}  // namespace rag_cli
