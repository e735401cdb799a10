#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/types/chunk.hpp"

namespace rag_core {

struct ChunkerConfig {
  // Both measured in Unicode code points.
  int chunk_size = 500;
  int chunk_overlap = 50;
};

/**
 * @class Chunker
 * @brief Splits document text into overlapping, size-bounded chunks.
 *
 * The text is cut into sentence-like units. A unit ends after a newline, after one of the
 * CJK terminators 。！？, or after an ASCII '.', '!' or '?' that is followed by whitespace
 * or the end of the text. Units are accumulated greedily while the chunk stays within
 * chunk_size; each new chunk starts with the last chunk_overlap code points of the previous
 * one. A unit that alone exceeds chunk_size becomes its own chunk and is never truncated.
 *
 * Chunk positions are byte offsets into the text passed in; content is the trimmed slice.
 */
class Chunker {
 public:
  /**
   * @throw ConfigurationError if chunk_size <= 0, chunk_overlap < 0 or
   *        chunk_overlap > chunk_size.
   */
  explicit Chunker(const ChunkerConfig& config);

  /**
   * @brief Chunks one document.
   *
   * @param text The document text, UTF-8.
   * @param metadata Document-level annotations copied into every chunk. The optional
   *        "source_file" key becomes Chunk::source_file.
   * @return Chunks in document order, numbered from 0. Empty for blank text.
   * @throw DocumentError if the text is not valid UTF-8.
   */
  std::vector<Chunk> chunk(const std::string& text,
                           const nlohmann::json& metadata = nlohmann::json::object()) const;

  const ChunkerConfig& config() const {
    return config_;
  }

 private:
  struct Unit {
    size_t begin;
    size_t end;
    size_t chars;
  };

  std::vector<Unit> split_into_units(const std::string& text) const;
  static size_t tail_start(const std::string& text, size_t span_start, size_t span_end,
                           size_t chars);
  void emit_chunk(const std::string& text, size_t span_start, size_t span_end,
                  const nlohmann::json& metadata, const std::string& source_file,
                  std::vector<Chunk>& out) const;

  ChunkerConfig config_;
};

}  // namespace rag_core
