#pragma once

#include <string>

namespace rag_core {

// Lower-case hex SHA-256 of the given bytes.
std::string sha256_hex(const std::string& content);

}  // namespace rag_core
