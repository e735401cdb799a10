#include "rag_core/extractors/markdown_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <regex>
#include <sstream>

#include "rag_core/errors.hpp"
#include "rag_core/utils/hashing.hpp"

namespace rag_core {

namespace {

struct Heading {
  size_t position;
  size_t level;
  std::string title;
};

const std::regex& heading_regex() {
  static const std::regex regex(R"(^(#{1,6})[ \t]+(.*))",
                                std::regex_constants::ECMAScript | std::regex_constants::multiline);
  return regex;
}

std::vector<Heading> find_headings(const std::string& content) {
  std::vector<Heading> headings;
  auto headings_begin = std::sregex_iterator(content.begin(), content.end(), heading_regex());
  auto headings_end = std::sregex_iterator();
  for (std::sregex_iterator i = headings_begin; i != headings_end; ++i) {
    std::string title = (*i)[2].str();
    while (!title.empty() && (title.back() == ' ' || title.back() == '\t' || title.back() == '#')) {
      title.pop_back();
    }
    headings.push_back({static_cast<size_t>(i->position()), static_cast<size_t>((*i)[1].length()),
                        title});
  }
  return headings;
}

std::string heading_path_at(const std::vector<Heading>& headings, size_t position) {
  std::vector<const Heading*> stack;
  for (const auto& heading : headings) {
    if (heading.position > position) {
      break;
    }
    while (!stack.empty() && stack.back()->level >= heading.level) {
      stack.pop_back();
    }
    stack.push_back(&heading);
  }

  std::string path;
  for (const Heading* heading : stack) {
    if (!path.empty()) {
      path += " > ";
    }
    path += heading->title;
  }
  return path;
}

auto to_sys_time = [](std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
};

std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

bool has_markdown_extension(const fs::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".md";
}

}  // namespace

MarkdownExtractor::MarkdownExtractor(const ChunkerConfig& config) : chunker_(config) {}

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return has_markdown_extension(file_path);
}

std::string MarkdownExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  std::string content = buffer.str();

  if (!utf8::is_valid(content.begin(), content.end())) {
    std::cerr << "Warning: " << file_path << " is not valid UTF-8, replacing invalid sequences"
              << std::endl;
    std::string repaired;
    utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(repaired));
    content = std::move(repaired);
  }
  return content;
}

std::string MarkdownExtractor::preprocess(const std::string& content) {
  std::vector<std::string> lines;
  std::stringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
      line.pop_back();
    }
    lines.push_back(line);
  }

  // Runs of blank lines collapse to a single blank line
  std::string result;
  bool previous_blank = false;
  for (const auto& current : lines) {
    bool blank = current.empty();
    if (blank && previous_blank) {
      continue;
    }
    result += current;
    result += '\n';
    previous_blank = blank;
  }

  size_t first = result.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  size_t last = result.find_last_not_of(" \t\r\n");
  return result.substr(first, last - first + 1);
}

nlohmann::json MarkdownExtractor::build_metadata(const fs::path& file_path,
                                                 const std::string& content) const {
  fs::path absolute_path = fs::absolute(file_path);

  std::string title = file_path.stem().string();
  bool has_title = false;
  size_t header_count = 0;
  for (const auto& heading : find_headings(content)) {
    if (!has_title && heading.level == 1) {
      title = heading.title;
      has_title = true;
    }
    ++header_count;
  }

  size_t fence_count = 0;
  for (size_t pos = content.find("```"); pos != std::string::npos;
       pos = content.find("```", pos + 3)) {
    ++fence_count;
  }

  std::error_code size_ec;
  std::uintmax_t file_size = fs::file_size(file_path, size_ec);
  std::error_code time_ec;
  std::string modified_time;
  auto ftime = fs::last_write_time(file_path, time_ec);
  if (!time_ec) {
    modified_time = time_point_to_string(to_sys_time(ftime));
  }

  nlohmann::json metadata = {
      {"file_name", file_path.filename().string()},
      {"file_path", absolute_path.string()},
      {"source_file", file_path.string()},
      {"file_size", size_ec ? 0 : file_size},
      {"modified_time", modified_time},
      {"title", title},
      {"content_length", utf8::distance(content.begin(), content.end())},
      {"header_count", header_count},
      {"code_block_count", fence_count / 2},
      {"content_hash", sha256_hex(content)},
      {"document_type", "markdown"},
  };
  return metadata;
}

Document MarkdownExtractor::load_document(const fs::path& file_path) const {
  if (!can_handle(file_path)) {
    throw DocumentError("Not a Markdown file: " + file_path.string());
  }
  if (!fs::is_regular_file(file_path)) {
    throw DocumentError("File not found: " + file_path.string());
  }

  Document document;
  document.content = preprocess(get_string_content(file_path));
  document.metadata = build_metadata(file_path, document.content);
  return document;
}

std::vector<Chunk> MarkdownExtractor::chunk_document(const Document& document) const {
  std::vector<Chunk> chunks = chunker_.chunk(document.content, document.metadata);
  if (chunks.empty()) {
    return chunks;
  }

  std::vector<Heading> headings = find_headings(document.content);
  for (auto& chunk : chunks) {
    size_t content_start = document.content.find_first_not_of(" \t\r\n", chunk.start_pos);
    if (content_start == std::string::npos) {
      content_start = chunk.start_pos;
    }
    chunk.metadata["heading_path"] = heading_path_at(headings, content_start);
  }
  return chunks;
}

std::vector<Chunk> MarkdownExtractor::extract(const fs::path& file_path) const {
  return chunk_document(load_document(file_path));
}

std::vector<fs::path> MarkdownExtractor::list_documents(const fs::path& directory,
                                                        size_t max_documents) {
  std::vector<fs::path> documents;
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return documents;
  }

  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    if (entry.is_regular_file(ec) && has_markdown_extension(entry.path())) {
      documents.push_back(entry.path());
    }
  }
  if (ec) {
    std::cerr << "Warning: Could not list " << directory << ": " << ec.message() << std::endl;
  }

  std::sort(documents.begin(), documents.end());
  if (documents.size() > max_documents) {
    std::cout << "Found " << documents.size() << " documents, using the first " << max_documents
              << std::endl;
    documents.resize(max_documents);
  }
  return documents;
}

}  // namespace rag_core
