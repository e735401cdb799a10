#include "rag_core/services/indexing_service.hpp"

#include <iostream>
#include <iterator>

#include "rag_core/errors.hpp"

namespace rag_core {

std::string to_string(IndexSource source) {
  switch (source) {
    case IndexSource::Built:
      return "built";
    case IndexSource::Loaded:
      return "loaded";
    case IndexSource::Demo:
      return "demo";
    default:
      return "unknown";
  }
}

IndexingService::IndexingService(std::shared_ptr<MarkdownExtractor> extractor,
                                 std::shared_ptr<Retriever> retriever,
                                 size_t max_documents)
    : extractor_(std::move(extractor)),
      retriever_(std::move(retriever)),
      max_documents_(max_documents) {
  if (!extractor_ || !retriever_) {
    throw ConfigurationError("IndexingService requires an extractor and a retriever");
  }
  if (max_documents_ == 0) {
    throw ConfigurationError("max_documents must be greater than 0");
  }
}

IndexingSummary IndexingService::index_directory(const fs::path& documents_dir,
                                                 const fs::path& index_path) {
  IndexingSummary summary;
  std::vector<Chunk> all_chunks;

  std::vector<fs::path> documents = MarkdownExtractor::list_documents(documents_dir, max_documents_);
  std::cout << "Indexing " << documents.size() << " documents from " << documents_dir
            << std::endl;

  for (const auto& path : documents) {
    try {
      std::vector<Chunk> chunks = extractor_->extract(path);
      std::cout << "  " << path.filename().string() << ": " << chunks.size() << " chunks"
                << std::endl;
      std::move(chunks.begin(), chunks.end(), std::back_inserter(all_chunks));
      ++summary.documents;
    } catch (const DocumentError& e) {
      std::cerr << "Warning: Skipping " << path << ": " << e.what() << std::endl;
      summary.failed_documents.push_back(path.string());
    }
  }

  summary.chunks = all_chunks.size();
  if (all_chunks.empty()) {
    std::cerr << "Warning: No content to index in " << documents_dir << std::endl;
    return summary;
  }

  retriever_->build_index_from_documents(all_chunks);
  summary.saved = retriever_->save_index(index_path);
  return summary;
}

IndexSource IndexingService::load_or_build(const fs::path& documents_dir,
                                           const fs::path& index_path) {
  if (!MarkdownExtractor::list_documents(documents_dir, max_documents_).empty()) {
    IndexingSummary summary = index_directory(documents_dir, index_path);
    if (summary.chunks > 0) {
      return IndexSource::Built;
    }
  }

  if (retriever_->load_index(index_path)) {
    return IndexSource::Loaded;
  }

  std::cout << "No documents or saved index found, running in demo mode" << std::endl;
  return IndexSource::Demo;
}

}  // namespace rag_core
