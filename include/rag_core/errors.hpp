#pragma once

#include <exception>
#include <string>

namespace rag_core {

class RagError : public std::exception {
 public:
  explicit RagError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Invalid chunking parameters, inconsistent vector dimensions at build time, bad config values.
class ConfigurationError : public RagError {
 public:
  explicit ConfigurationError(const std::string& message) : RagError(message) {}
};

// Query vector does not match the dimension of the built index.
class DimensionMismatchError : public RagError {
 public:
  explicit DimensionMismatchError(const std::string& message) : RagError(message) {}
};

// Persisted index is corrupt, truncated or was written for another dimension.
class IndexFormatError : public RagError {
 public:
  explicit IndexFormatError(const std::string& message) : RagError(message) {}
};

// The embedding backend failed or returned unusable vectors.
class EmbeddingError : public RagError {
 public:
  explicit EmbeddingError(const std::string& message) : RagError(message) {}
};

// The text generation backend failed.
class GenerationError : public RagError {
 public:
  explicit GenerationError(const std::string& message) : RagError(message) {}
};

// A source document could not be read or decoded.
class DocumentError : public RagError {
 public:
  explicit DocumentError(const std::string& message) : RagError(message) {}
};

}  // namespace rag_core
