#include "rag_core/services/retriever.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <iterator>
#include <string>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

void check_threshold(float similarity_threshold) {
  if (similarity_threshold < 0.0f || similarity_threshold > 1.0f) {
    throw ConfigurationError("similarity_threshold must be between 0 and 1, got " +
                             std::to_string(similarity_threshold));
  }
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

QueryResult to_query_result(const ScoredChunk& hit) {
  QueryResult result;
  result.chunk_id = hit.chunk.id;
  result.content = hit.chunk.content;
  result.source_file = hit.chunk.source_file;
  result.chunk_index = hit.chunk.chunk_index;
  result.metadata = hit.chunk.metadata;
  result.score = hit.score;
  return result;
}

}  // namespace

Retriever::Retriever(std::shared_ptr<Embedder> embedder,
                     std::shared_ptr<VectorIndex> index,
                     const RetrieverConfig& config)
    : embedder_(std::move(embedder)), index_(std::move(index)), config_(config) {
  if (!embedder_ || !index_) {
    throw ConfigurationError("Retriever requires an embedder and a vector index");
  }
  if (config_.embedding_batch_size <= 0) {
    throw ConfigurationError("embedding_batch_size must be greater than 0");
  }
  if (config_.max_in_flight_batches <= 0) {
    throw ConfigurationError("max_in_flight_batches must be greater than 0");
  }
  if (config_.candidate_multiplier <= 0) {
    throw ConfigurationError("candidate_multiplier must be greater than 0");
  }
  if (config_.default_top_k <= 0) {
    throw ConfigurationError("default top_k must be greater than 0");
  }
  check_threshold(config_.default_similarity_threshold);
}

void Retriever::build_index_from_documents(const std::vector<Chunk>& chunks) {
  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.content);
  }

  std::cout << "Embedding " << chunks.size() << " chunks..." << std::endl;
  std::vector<std::vector<float>> vectors = embed_in_batches(texts);

  std::vector<IndexEntry> entries;
  entries.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    entries.push_back({std::move(vectors[i]), chunks[i]});
  }
  index_->build(entries);
}

std::vector<std::vector<float>> Retriever::embed_in_batches(
    const std::vector<std::string>& texts) const {
  const size_t batch_size = static_cast<size_t>(config_.embedding_batch_size);
  const size_t in_flight = static_cast<size_t>(config_.max_in_flight_batches);
  const size_t batch_count = (texts.size() + batch_size - 1) / batch_size;

  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t wave_start = 0; wave_start < batch_count; wave_start += in_flight) {
    const size_t wave_end = std::min(batch_count, wave_start + in_flight);

    if (in_flight == 1) {
      auto batch = embed_batch(texts, wave_start * batch_size,
                               std::min(texts.size(), (wave_start + 1) * batch_size));
      std::move(batch.begin(), batch.end(), std::back_inserter(vectors));
    } else {
      std::vector<std::future<std::vector<std::vector<float>>>> futures;
      futures.reserve(wave_end - wave_start);
      for (size_t b = wave_start; b < wave_end; ++b) {
        const size_t begin = b * batch_size;
        const size_t end = std::min(texts.size(), begin + batch_size);
        futures.push_back(std::async(std::launch::async, [this, &texts, begin, end]() {
          return embed_batch(texts, begin, end);
        }));
      }
      // Collected in launch order so the output stays aligned with the input.
      for (auto& future : futures) {
        auto batch = future.get();
        std::move(batch.begin(), batch.end(), std::back_inserter(vectors));
      }
    }

    size_t done = std::min(texts.size(), wave_end * batch_size);
    std::cout << "Embedded " << done << " of " << texts.size() << " chunks" << std::endl;
  }

  return vectors;
}

std::vector<std::vector<float>> Retriever::embed_batch(const std::vector<std::string>& texts,
                                                       size_t begin,
                                                       size_t end) const {
  std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);
  std::vector<std::vector<float>> vectors = embedder_->encode(batch);
  if (vectors.size() != batch.size()) {
    throw EmbeddingError("Embedder returned " + std::to_string(vectors.size()) +
                         " vectors for a batch of " + std::to_string(batch.size()) + " texts");
  }
  for (const auto& vector : vectors) {
    if (vector.empty()) {
      throw EmbeddingError("Received empty embedding for a chunk.");
    }
  }
  return vectors;
}

std::vector<float> Retriever::embed_query(const std::string& query) const {
  std::vector<std::vector<float>> vectors = embedder_->encode({query});
  if (vectors.size() != 1 || vectors.front().empty()) {
    throw EmbeddingError("Embedder returned no vector for the query");
  }
  return std::move(vectors.front());
}

std::vector<QueryResult> Retriever::search(const std::string& query,
                                           int top_k,
                                           float similarity_threshold) const {
  check_threshold(similarity_threshold);
  if (top_k <= 0 || is_blank(query) || index_->empty()) {
    return {};
  }

  std::vector<float> query_vector = embed_query(query);
  const size_t candidates =
      static_cast<size_t>(top_k) * static_cast<size_t>(config_.candidate_multiplier);
  std::vector<ScoredChunk> hits = index_->search(query_vector, candidates);

  std::vector<QueryResult> results;
  results.reserve(std::min(hits.size(), static_cast<size_t>(top_k)));
  for (const auto& hit : hits) {
    if (results.size() >= static_cast<size_t>(top_k)) {
      break;
    }
    if (similarity_threshold != 0.0f && hit.score < similarity_threshold) {
      continue;
    }
    results.push_back(to_query_result(hit));
  }
  return results;
}

std::vector<QueryResult> Retriever::search(const std::string& query) const {
  return search(query, config_.default_top_k, config_.default_similarity_threshold);
}

std::vector<QueryResult> Retriever::search_with_status(const std::string& query,
                                                       int top_k,
                                                       float similarity_threshold) const {
  try {
    return search(query, top_k, similarity_threshold);
  } catch (const EmbeddingError& e) {
    std::cerr << "Error: Search failed: " << e.what() << std::endl;
    QueryResult degraded;
    degraded.status = QueryStatus::Error;
    degraded.error_msg = e.what();
    return {degraded};
  }
}

bool Retriever::save_index(const std::filesystem::path& path) const {
  return index_->save(path);
}

bool Retriever::load_index(const std::filesystem::path& path) {
  return index_->load(path);
}

RetrieverStats Retriever::get_stats() const {
  RetrieverStats stats;
  stats.index = index_->stats();
  stats.indexed_chunks = index_->size();
  stats.ready = stats.indexed_chunks > 0;
  return stats;
}

bool Retriever::is_ready() const {
  return !index_->empty();
}

}  // namespace rag_core
