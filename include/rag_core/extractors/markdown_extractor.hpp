#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/chunking/chunker.hpp"
#include "rag_core/types/chunk.hpp"

namespace fs = std::filesystem;

namespace rag_core {

struct Document {
  std::string content;  // preprocessed text
  nlohmann::json metadata = nlohmann::json::object();
};

class MarkdownExtractor {
 public:
  explicit MarkdownExtractor(const ChunkerConfig& config = {});

  // Checks the extension only (".md", any case)
  bool can_handle(const fs::path& file_path) const;

  /**
   * @brief Reads, repairs and preprocesses one Markdown file and collects its metadata.
   * @throw DocumentError if the file is not Markdown or cannot be read.
   */
  Document load_document(const fs::path& file_path) const;

  // load_document() followed by chunk_document()
  std::vector<Chunk> extract(const fs::path& file_path) const;

  // Chunks a loaded document and annotates each chunk with its heading path.
  std::vector<Chunk> chunk_document(const Document& document) const;

  // Markdown files directly inside the directory, sorted by name, at most max_documents.
  static std::vector<fs::path> list_documents(const fs::path& directory, size_t max_documents);

  static std::string preprocess(const std::string& content);

 private:
  std::string get_string_content(const fs::path& file_path) const;
  nlohmann::json build_metadata(const fs::path& file_path, const std::string& content) const;

  Chunker chunker_;
};

}  // namespace rag_core
