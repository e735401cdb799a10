#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. rag_core/types/chunk.hpp),
// users can simply do `#include "rag_core/types.hpp"`.
//
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/query_result.hpp"
