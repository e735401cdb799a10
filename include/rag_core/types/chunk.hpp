#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace rag_core {

struct Chunk {
  std::string id;
  std::string content;
  std::string source_file;
  int chunk_index = 0;
  // Byte offsets into the text the chunk was cut from, before trimming.
  size_t start_pos = 0;
  size_t end_pos = 0;
  nlohmann::json metadata = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const Chunk& chunk);
void from_json(const nlohmann::json& j, Chunk& chunk);

}  // namespace rag_core
