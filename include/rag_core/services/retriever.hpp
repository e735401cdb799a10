#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedder.hpp"
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/query_result.hpp"

namespace rag_core {

struct RetrieverConfig {
  int embedding_batch_size = 32;
  int max_in_flight_batches = 1;
  // How many index candidates are fetched per requested result before threshold filtering.
  int candidate_multiplier = 2;
  int default_top_k = 5;
  float default_similarity_threshold = 0.3f;
};

struct RetrieverStats {
  IndexStats index;
  size_t indexed_chunks = 0;
  bool ready = false;
};

/**
 * @class Retriever
 * @brief Embeds chunks into the vector index and answers similarity queries against it.
 *
 * Builds are all-or-nothing: every chunk is embedded before the index is touched, so an
 * embedding failure leaves the previous index generation searchable.
 */
class Retriever {
 public:
  /**
   * @throw ConfigurationError for non-positive batch sizes, multipliers or top_k, or a
   *        threshold outside [0, 1].
   */
  Retriever(std::shared_ptr<Embedder> embedder,
            std::shared_ptr<VectorIndex> index,
            const RetrieverConfig& config = {});

  /**
   * @brief Replaces the index content with the given chunks.
   * @throw EmbeddingError if the embedder fails or returns the wrong number of vectors.
   * @throw ConfigurationError if the vectors disagree with the index dimension.
   */
  void build_index_from_documents(const std::vector<Chunk>& chunks);

  /**
   * @brief Ranked chunks for a natural-language query.
   *
   * A similarity_threshold of exactly 0 disables filtering; otherwise hits scoring below it
   * are dropped. Blank queries and non-positive top_k return nothing.
   * @throw ConfigurationError if similarity_threshold is outside [0, 1].
   * @throw EmbeddingError if the query cannot be embedded.
   */
  std::vector<QueryResult> search(const std::string& query,
                                  int top_k,
                                  float similarity_threshold) const;
  std::vector<QueryResult> search(const std::string& query) const;

  // Like search(), but embedding failures come back as a single result with status Error.
  std::vector<QueryResult> search_with_status(const std::string& query,
                                              int top_k,
                                              float similarity_threshold) const;

  bool save_index(const std::filesystem::path& path) const;
  bool load_index(const std::filesystem::path& path);

  RetrieverStats get_stats() const;
  bool is_ready() const;

  const RetrieverConfig& config() const {
    return config_;
  }

 private:
  std::vector<std::vector<float>> embed_in_batches(const std::vector<std::string>& texts) const;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts,
                                              size_t begin,
                                              size_t end) const;
  std::vector<float> embed_query(const std::string& query) const;

  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<VectorIndex> index_;
  RetrieverConfig config_;
};

}  // namespace rag_core
