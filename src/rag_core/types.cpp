#include "rag_core/types.hpp"

namespace rag_core {

std::string to_string(QueryStatus status) {
  switch (status) {
    case QueryStatus::Ok:
      return "OK";
    case QueryStatus::Error:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

void to_json(nlohmann::json& j, const Chunk& chunk) {
  j = nlohmann::json{{"id", chunk.id},
                     {"content", chunk.content},
                     {"source_file", chunk.source_file},
                     {"chunk_index", chunk.chunk_index},
                     {"start_pos", chunk.start_pos},
                     {"end_pos", chunk.end_pos},
                     {"metadata", chunk.metadata}};
}

void from_json(const nlohmann::json& j, Chunk& chunk) {
  j.at("id").get_to(chunk.id);
  j.at("content").get_to(chunk.content);
  j.at("source_file").get_to(chunk.source_file);
  j.at("chunk_index").get_to(chunk.chunk_index);
  j.at("start_pos").get_to(chunk.start_pos);
  j.at("end_pos").get_to(chunk.end_pos);
  chunk.metadata = j.value("metadata", nlohmann::json::object());
}

}  // namespace rag_core
