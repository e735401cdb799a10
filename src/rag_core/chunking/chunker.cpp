#include "rag_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cstdint>

#include "rag_core/errors.hpp"
#include "rag_core/utils/hashing.hpp"

namespace rag_core {

namespace {

constexpr uint32_t kCjkFullStop = 0x3002;        // 。
constexpr uint32_t kFullwidthExclamation = 0xFF01;  // ！
constexpr uint32_t kFullwidthQuestion = 0xFF1F;     // ？

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), is_ascii_space);
}

bool is_blank_range(const std::string& text, size_t begin, size_t end) {
  return std::all_of(text.begin() + begin, text.begin() + end, is_ascii_space);
}

// `next` points just past the code point being examined.
bool ends_unit(uint32_t code_point, std::string::const_iterator next,
               std::string::const_iterator end) {
  switch (code_point) {
    case '\n':
    case kCjkFullStop:
    case kFullwidthExclamation:
    case kFullwidthQuestion:
      return true;
    case '.':
    case '!':
    case '?':
      return next == end || is_ascii_space(*next);
    default:
      return false;
  }
}

}  // namespace

Chunker::Chunker(const ChunkerConfig& config) : config_(config) {
  if (config_.chunk_size <= 0) {
    throw ConfigurationError("chunk_size must be greater than 0, got " +
                             std::to_string(config_.chunk_size));
  }
  if (config_.chunk_overlap < 0) {
    throw ConfigurationError("chunk_overlap must not be negative, got " +
                             std::to_string(config_.chunk_overlap));
  }
  if (config_.chunk_overlap > config_.chunk_size) {
    throw ConfigurationError("chunk_overlap (" + std::to_string(config_.chunk_overlap) +
                             ") must not exceed chunk_size (" +
                             std::to_string(config_.chunk_size) + ")");
  }
}

std::vector<Chunker::Unit> Chunker::split_into_units(const std::string& text) const {
  std::vector<Unit> units;
  const auto begin = text.begin();
  const auto end = text.end();

  auto unit_start = begin;
  size_t chars = 0;
  for (auto it = begin; it != end;) {
    uint32_t code_point = utf8::next(it, end);
    ++chars;
    if (ends_unit(code_point, it, end)) {
      units.push_back({static_cast<size_t>(unit_start - begin), static_cast<size_t>(it - begin),
                       chars});
      unit_start = it;
      chars = 0;
    }
  }
  if (unit_start != end) {
    units.push_back({static_cast<size_t>(unit_start - begin), text.size(), chars});
  }
  return units;
}

// Byte offset where the last `chars` code points of [span_start, span_end) begin.
size_t Chunker::tail_start(const std::string& text, size_t span_start, size_t span_end,
                           size_t chars) {
  auto lower = text.begin() + span_start;
  auto it = text.begin() + span_end;
  for (size_t i = 0; i < chars && it != lower; ++i) {
    utf8::prior(it, lower);
  }
  return static_cast<size_t>(it - text.begin());
}

void Chunker::emit_chunk(const std::string& text, size_t span_start, size_t span_end,
                         const nlohmann::json& metadata, const std::string& source_file,
                         std::vector<Chunk>& out) const {
  size_t first = span_start;
  size_t last = span_end;
  while (first < last && is_ascii_space(text[first])) {
    ++first;
  }
  while (last > first && is_ascii_space(text[last - 1])) {
    --last;
  }
  if (first == last) {
    return;  // whitespace only
  }

  Chunk chunk;
  chunk.content = text.substr(first, last - first);
  chunk.source_file = source_file;
  chunk.chunk_index = static_cast<int>(out.size());
  chunk.start_pos = span_start;
  chunk.end_pos = span_end;
  chunk.id = sha256_hex(source_file + "#" + std::to_string(chunk.chunk_index) + "#" +
                        chunk.content)
                 .substr(0, 16);

  chunk.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
  chunk.metadata["chunk_index"] = chunk.chunk_index;
  chunk.metadata["chunk_length"] = utf8::distance(chunk.content.begin(), chunk.content.end());
  chunk.metadata["start_pos"] = chunk.start_pos;
  chunk.metadata["end_pos"] = chunk.end_pos;

  out.push_back(std::move(chunk));
}

std::vector<Chunk> Chunker::chunk(const std::string& text, const nlohmann::json& metadata) const {
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw DocumentError("Document text is not valid UTF-8");
  }
  if (is_blank(text)) {
    return {};
  }

  std::string source_file;
  if (metadata.is_object() && metadata.contains("source_file") &&
      metadata["source_file"].is_string()) {
    source_file = metadata["source_file"].get<std::string>();
  }

  const size_t chunk_size = static_cast<size_t>(config_.chunk_size);
  const size_t chunk_overlap = static_cast<size_t>(config_.chunk_overlap);

  std::vector<Chunk> chunks;
  // The buffer is always the contiguous byte range [span_start, span_end) of the text.
  size_t span_start = 0;
  size_t span_end = 0;
  size_t span_chars = 0;
  bool has_new_units = false;

  for (const Unit& unit : split_into_units(text)) {
    if (span_chars > 0 && span_chars + unit.chars > chunk_size) {
      size_t keep = span_chars;
      if (has_new_units) {
        emit_chunk(text, span_start, span_end, metadata, source_file, chunks);
        keep = chunk_overlap;
      }
      // Shrink the carried context so that it still fits next to the unit.
      keep = std::min({keep, span_chars, chunk_size - std::min(unit.chars, chunk_size)});
      span_start = tail_start(text, span_start, span_end, keep);
      span_chars = keep;
      has_new_units = false;
    }

    if (span_chars == 0) {
      span_start = unit.begin;
    }
    span_end = unit.end;
    span_chars += unit.chars;
    // Blank units (paragraph breaks) are not new material on their own.
    has_new_units = has_new_units || !is_blank_range(text, unit.begin, unit.end);

    if (span_chars > chunk_size) {
      // Only reachable for a single oversized unit: emit it alone.
      emit_chunk(text, span_start, span_end, metadata, source_file, chunks);
      size_t keep = std::min(chunk_overlap, span_chars);
      span_start = tail_start(text, span_start, span_end, keep);
      span_chars = keep;
      has_new_units = false;
    }
  }

  if (has_new_units) {
    emit_chunk(text, span_start, span_end, metadata, source_file, chunks);
  }

  return chunks;
}

}  // namespace rag_core
