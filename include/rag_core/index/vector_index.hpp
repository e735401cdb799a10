#pragma once

#include <faiss/Index.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

enum class IndexKind { Flat, HNSW };

std::string to_string(IndexKind kind);
IndexKind index_kind_from_string(const std::string& str);

struct VectorIndexConfig {
  IndexKind kind = IndexKind::HNSW;
  // 0 lets the first build decide.
  size_t dimension = 0;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
};

struct IndexEntry {
  std::vector<float> vector;
  Chunk chunk;
};

struct ScoredChunk {
  Chunk chunk;
  float score;
};

struct IndexStats {
  size_t total_vectors = 0;
  size_t dimension = 0;
  size_t index_size_bytes = 0;
  std::string index_type;
  bool is_trained = false;
};

/**
 * @class VectorIndex
 * @brief Inner-product index over L2-normalised chunk embeddings, backed by faiss.
 *
 * Content lives in an immutable generation. build() and load() assemble a complete new
 * generation and swap it in, so searches running concurrently finish against the
 * generation they started with. Writers are serialised.
 */
class VectorIndex {
 public:
  explicit VectorIndex(const VectorIndexConfig& config = {});
  ~VectorIndex();

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;
  VectorIndex(VectorIndex&&) = delete;
  VectorIndex& operator=(VectorIndex&&) = delete;

  /**
   * @brief Replaces the whole index content with the given entries.
   * @throw ConfigurationError if the entries disagree on dimension, or differ from the
   *        dimension fixed by an earlier build/load or by the config.
   */
  void build(const std::vector<IndexEntry>& entries);

  /**
   * @brief Top-k chunks by descending cosine similarity.
   *
   * Equal scores are ordered by ascending chunk_index, then by insertion order.
   * Returns an empty list when nothing has been built or loaded.
   * @throw DimensionMismatchError if the query has the wrong length.
   */
  std::vector<ScoredChunk> search(const std::vector<float>& query_vector, size_t top_k) const;

  /**
   * @brief Writes the index to a single file (temporary file + rename).
   * @return false if the index is empty or the file could not be written.
   */
  bool save(const std::filesystem::path& path) const;

  /**
   * @brief Replaces the content with a previously saved index.
   * @return false if the file does not exist.
   * @throw IndexFormatError if the file is corrupt or its dimension differs from the one this
   *        index is fixed to.
   */
  bool load(const std::filesystem::path& path);

  // Drops all content and unfixes the dimension.
  void reset();

  size_t size() const;
  bool empty() const;
  // 0 while no dimension has been fixed.
  size_t dimension() const;
  IndexStats stats() const;

 private:
  struct Generation {
    IndexKind kind;
    size_t dimension;
    std::unique_ptr<faiss::Index> index;
    std::vector<Chunk> chunks;  // position -> chunk, parallel to the faiss labels
  };

  std::shared_ptr<const Generation> snapshot() const;
  void install(std::shared_ptr<const Generation> generation);

  std::unique_ptr<faiss::Index> create_base_index(IndexKind kind, size_t dimension) const;
  void search_faiss_index(const Generation& generation, const std::vector<float>& query_vector,
                          size_t k, std::vector<float>& distances,
                          std::vector<faiss::idx_t>& labels) const;

  VectorIndexConfig config_;

  std::mutex write_mutex_;
  mutable std::mutex generation_mutex_;
  std::shared_ptr<const Generation> generation_;
  size_t dimension_;
};

}  // namespace rag_core
