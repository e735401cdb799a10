#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace rag_core {

enum class QueryStatus { Ok, Error };

std::string to_string(QueryStatus status);

struct QueryResult {
  std::string chunk_id;
  std::string content;
  std::string source_file;
  int chunk_index = 0;
  nlohmann::json metadata = nlohmann::json::object();
  float score = 0.0f;
  QueryStatus status = QueryStatus::Ok;
  std::string error_msg;
};

}  // namespace rag_core
