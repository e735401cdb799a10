#pragma once

#include <string>
#include <vector>

namespace rag_core {

// Maps texts to fixed-length vectors. Implementations must be deterministic for a given model.
class Embedder {
 public:
  virtual ~Embedder() = default;

  /**
   * @brief One vector per input text, in input order.
   * @throw EmbeddingError if the backend fails.
   */
  virtual std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) = 0;
};

}  // namespace rag_core
