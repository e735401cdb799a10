#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/extractors/markdown_extractor.hpp"
#include "rag_core/services/retriever.hpp"

namespace rag_core {

struct IndexingSummary {
  size_t documents = 0;
  size_t chunks = 0;
  std::vector<std::string> failed_documents;
  bool saved = false;
};

enum class IndexSource { Built, Loaded, Demo };

std::string to_string(IndexSource source);

class IndexingService {
 public:
  IndexingService(std::shared_ptr<MarkdownExtractor> extractor,
                  std::shared_ptr<Retriever> retriever,
                  size_t max_documents = 100);

  /**
   * @brief Extracts every Markdown file in the directory, rebuilds the index and saves it.
   *
   * Files that fail to load are logged and skipped.
   * @throw EmbeddingError if embedding fails; the previous index stays in place.
   */
  IndexingSummary index_directory(const fs::path& documents_dir, const fs::path& index_path);

  /**
   * @brief Builds from the documents when there are any, otherwise loads the saved index.
   *
   * Falls back to Demo (an empty index) when neither documents nor a saved index exist.
   */
  IndexSource load_or_build(const fs::path& documents_dir, const fs::path& index_path);

 private:
  std::shared_ptr<MarkdownExtractor> extractor_;
  std::shared_ptr<Retriever> retriever_;
  size_t max_documents_;
};

}  // namespace rag_core
