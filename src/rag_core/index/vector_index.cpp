#include "rag_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/index_io.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

constexpr char kFileMagic[8] = {'R', 'A', 'G', 'V', 'I', 'D', 'X', '\0'};
constexpr uint32_t kFormatVersion = 1;

template <typename T>
void append_pod(std::string& out, const T& value) {
  out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

// Bounds-checked cursor over the raw bytes of an index file.
class ByteReader {
 public:
  explicit ByteReader(const std::vector<char>& data) : data_(data) {}

  template <typename T>
  T read_pod(const char* what) {
    T value;
    std::memcpy(&value, take(sizeof(T), what), sizeof(T));
    return value;
  }

  const char* take(size_t length, const char* what) {
    if (length > data_.size() - pos_) {
      throw IndexFormatError(std::string("Index file truncated while reading ") + what);
    }
    const char* ptr = data_.data() + pos_;
    pos_ += length;
    return ptr;
  }

  bool at_end() const {
    return pos_ == data_.size();
  }

 private:
  const std::vector<char>& data_;
  size_t pos_ = 0;
};

}  // namespace

std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Flat:
      return "flat";
    case IndexKind::HNSW:
      return "hnsw";
    default:
      return "unknown";
  }
}

IndexKind index_kind_from_string(const std::string& str) {
  if (str == "flat")
    return IndexKind::Flat;
  if (str == "hnsw")
    return IndexKind::HNSW;
  throw ConfigurationError("Unknown index type: " + str);
}

VectorIndex::VectorIndex(const VectorIndexConfig& config)
    : config_(config), dimension_(config.dimension) {
  if (config_.hnsw_m <= 0 || config_.hnsw_ef_construction <= 0 || config_.hnsw_ef_search <= 0) {
    throw ConfigurationError("HNSW parameters must be greater than 0");
  }
}

VectorIndex::~VectorIndex() = default;

std::shared_ptr<const VectorIndex::Generation> VectorIndex::snapshot() const {
  std::lock_guard<std::mutex> lock(generation_mutex_);
  return generation_;
}

void VectorIndex::install(std::shared_ptr<const Generation> generation) {
  std::lock_guard<std::mutex> lock(generation_mutex_);
  dimension_ = generation->dimension;
  generation_ = std::move(generation);
}

void VectorIndex::build(const std::vector<IndexEntry>& entries) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);

  const size_t fixed_dimension = dimension();
  if (entries.empty()) {
    if (fixed_dimension == 0) {
      // Nothing to infer a dimension from; an empty generation still replaces the content.
      std::lock_guard<std::mutex> lock(generation_mutex_);
      generation_.reset();
      return;
    }
    auto generation = std::make_shared<Generation>();
    generation->kind = config_.kind;
    generation->dimension = fixed_dimension;
    generation->index = create_base_index(config_.kind, fixed_dimension);
    install(std::move(generation));
    std::cout << "Vector index cleared (dimension " << fixed_dimension << ")" << std::endl;
    return;
  }

  const size_t dim = entries.front().vector.size();
  if (dim == 0) {
    throw ConfigurationError("Cannot build an index from empty vectors");
  }
  if (fixed_dimension != 0 && dim != fixed_dimension) {
    throw ConfigurationError("Vector dimension mismatch. Index is fixed to " +
                             std::to_string(fixed_dimension) + ", got " + std::to_string(dim) +
                             "; reset() the index to change its dimension");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(entries.size() * dim);
  std::vector<Chunk> chunks;
  chunks.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& entry = entries[i];
    if (entry.vector.size() != dim) {
      throw ConfigurationError("Vector dimension mismatch at entry " + std::to_string(i) +
                               ". Expected " + std::to_string(dim) + ", got " +
                               std::to_string(entry.vector.size()));
    }
    all_vectors_flat.insert(all_vectors_flat.end(), entry.vector.begin(), entry.vector.end());
    chunks.push_back(entry.chunk);
  }
  // Zero vectors are left as they are.
  faiss::fvec_renorm_L2(dim, entries.size(), all_vectors_flat.data());

  auto generation = std::make_shared<Generation>();
  generation->kind = config_.kind;
  generation->dimension = dim;
  generation->index = create_base_index(config_.kind, dim);
  try {
    generation->index->add(static_cast<faiss::idx_t>(entries.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException& e) {
    throw ConfigurationError("Failed to add vectors to the faiss index: " + std::string(e.what()));
  }
  generation->chunks = std::move(chunks);

  install(std::move(generation));
  std::cout << "Vector index built: " << entries.size() << " vectors, dimension " << dim << ", "
            << to_string(config_.kind) << std::endl;
}

std::vector<ScoredChunk> VectorIndex::search(const std::vector<float>& query_vector,
                                             size_t top_k) const {
  auto generation = snapshot();
  if (!generation || generation->chunks.empty() || top_k == 0) {
    return {};
  }

  if (query_vector.size() != generation->dimension) {
    throw DimensionMismatchError("Query vector dimension mismatch. Expected " +
                                 std::to_string(generation->dimension) + ", got " +
                                 std::to_string(query_vector.size()));
  }

  std::vector<float> query = query_vector;
  faiss::fvec_renorm_L2(query.size(), 1, query.data());

  const size_t total = generation->chunks.size();
  const size_t wanted = std::min(top_k, total);
  size_t fetch = wanted;
  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  while (true) {
    distances.assign(fetch, 0.0f);
    labels.assign(fetch, -1);
    search_faiss_index(*generation, query, fetch, distances, labels);

    // Widen the fetch while a tie group may continue past what was retrieved, so the
    // chunk_index tie-break sees every member of the group at the cut.
    if (fetch >= total || labels[fetch - 1] == -1 ||
        distances[wanted - 1] != distances[fetch - 1]) {
      break;
    }
    fetch = std::min(total, fetch * 2);
  }

  struct Candidate {
    faiss::idx_t position;
    float score;
  };
  std::vector<Candidate> candidates;
  candidates.reserve(fetch);
  for (size_t i = 0; i < fetch; ++i) {
    if (labels[i] < 0 || static_cast<size_t>(labels[i]) >= total) {
      continue;
    }
    candidates.push_back({labels[i], distances[i]});
  }

  std::sort(candidates.begin(), candidates.end(), [&](const Candidate& a, const Candidate& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    int a_index = generation->chunks[a.position].chunk_index;
    int b_index = generation->chunks[b.position].chunk_index;
    if (a_index != b_index) {
      return a_index < b_index;
    }
    return a.position < b.position;
  });

  std::vector<ScoredChunk> results;
  results.reserve(std::min(candidates.size(), wanted));
  for (const auto& candidate : candidates) {
    if (results.size() >= wanted) {
      break;
    }
    results.push_back({generation->chunks[candidate.position], candidate.score});
  }
  return results;
}

bool VectorIndex::save(const std::filesystem::path& path) const {
  auto generation = snapshot();
  if (!generation || generation->chunks.empty()) {
    std::cerr << "Warning: Vector index is empty, nothing saved to " << path << std::endl;
    return false;
  }

  faiss::VectorIOWriter faiss_writer;
  try {
    faiss::write_index(generation->index.get(), &faiss_writer);
  } catch (const faiss::FaissException& e) {
    std::cerr << "Error: Failed to serialize faiss index: " << e.what() << std::endl;
    return false;
  }

  nlohmann::json table = nlohmann::json::array();
  for (const auto& chunk : generation->chunks) {
    table.push_back(chunk);
  }
  std::vector<std::uint8_t> table_bytes = nlohmann::json::to_cbor(table);

  std::string header;
  header.append(kFileMagic, sizeof(kFileMagic));
  append_pod(header, kFormatVersion);
  append_pod(header, static_cast<uint32_t>(generation->kind));
  append_pod(header, static_cast<uint64_t>(generation->dimension));
  append_pod(header, static_cast<uint64_t>(generation->chunks.size()));

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "Error: Failed to create index directory " << path.parent_path() << ": "
                << ec.message() << std::endl;
      return false;
    }
  }

  std::filesystem::path temp_path = path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      std::cerr << "Error: Could not open " << temp_path << " for writing" << std::endl;
      return false;
    }
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    uint64_t faiss_size = faiss_writer.data.size();
    out.write(reinterpret_cast<const char*>(&faiss_size), sizeof(faiss_size));
    out.write(reinterpret_cast<const char*>(faiss_writer.data.data()),
              static_cast<std::streamsize>(faiss_writer.data.size()));
    uint64_t table_size = table_bytes.size();
    out.write(reinterpret_cast<const char*>(&table_size), sizeof(table_size));
    out.write(reinterpret_cast<const char*>(table_bytes.data()),
              static_cast<std::streamsize>(table_bytes.size()));
    out.flush();
    if (!out) {
      std::cerr << "Error: Failed writing index file " << temp_path << std::endl;
      out.close();
      std::filesystem::remove(temp_path, ec);
      return false;
    }
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::cerr << "Error: Failed to move " << temp_path << " to " << path << ": " << ec.message()
              << std::endl;
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::cout << "Vector index saved to " << path << " (" << generation->chunks.size()
            << " vectors)" << std::endl;
  return true;
}

bool VectorIndex::load(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);

  if (!std::filesystem::exists(path)) {
    return false;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IndexFormatError("Could not open index file: " + path.string());
  }
  std::vector<char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  ByteReader reader(data);
  const char* magic = reader.take(sizeof(kFileMagic), "magic");
  if (std::memcmp(magic, kFileMagic, sizeof(kFileMagic)) != 0) {
    throw IndexFormatError("Not an index file: " + path.string());
  }
  uint32_t version = reader.read_pod<uint32_t>("version");
  if (version != kFormatVersion) {
    throw IndexFormatError("Unsupported index format version " + std::to_string(version));
  }
  uint32_t kind_value = reader.read_pod<uint32_t>("index kind");
  if (kind_value > static_cast<uint32_t>(IndexKind::HNSW)) {
    throw IndexFormatError("Unknown index kind " + std::to_string(kind_value));
  }
  uint64_t file_dimension = reader.read_pod<uint64_t>("dimension");
  uint64_t count = reader.read_pod<uint64_t>("vector count");

  const size_t fixed_dimension = dimension();
  if (file_dimension == 0) {
    throw IndexFormatError("Index file records a zero dimension");
  }
  if (fixed_dimension != 0 && file_dimension != fixed_dimension) {
    throw IndexFormatError("Index file dimension " + std::to_string(file_dimension) +
                           " does not match index dimension " + std::to_string(fixed_dimension));
  }

  uint64_t faiss_size = reader.read_pod<uint64_t>("faiss index size");
  const char* faiss_bytes = reader.take(faiss_size, "faiss index");
  uint64_t table_size = reader.read_pod<uint64_t>("chunk table size");
  const char* table_bytes = reader.take(table_size, "chunk table");
  if (!reader.at_end()) {
    throw IndexFormatError("Trailing bytes after chunk table in " + path.string());
  }

  auto generation = std::make_shared<Generation>();
  generation->kind = static_cast<IndexKind>(kind_value);
  generation->dimension = file_dimension;

  faiss::VectorIOReader faiss_reader;
  faiss_reader.data.assign(reinterpret_cast<const uint8_t*>(faiss_bytes),
                           reinterpret_cast<const uint8_t*>(faiss_bytes) + faiss_size);
  try {
    generation->index.reset(faiss::read_index(&faiss_reader));
  } catch (const faiss::FaissException& e) {
    throw IndexFormatError("Corrupt faiss index in " + path.string() + ": " + e.what());
  }
  if (static_cast<uint64_t>(generation->index->d) != file_dimension ||
      static_cast<uint64_t>(generation->index->ntotal) != count) {
    throw IndexFormatError("Faiss index in " + path.string() +
                           " disagrees with the recorded dimension or vector count");
  }

  try {
    nlohmann::json table = nlohmann::json::from_cbor(
        reinterpret_cast<const uint8_t*>(table_bytes),
        reinterpret_cast<const uint8_t*>(table_bytes) + table_size);
    if (!table.is_array() || table.size() != count) {
      throw IndexFormatError("Chunk table in " + path.string() + " has " +
                             std::to_string(table.is_array() ? table.size() : 0) +
                             " entries, expected " + std::to_string(count));
    }
    generation->chunks.reserve(count);
    for (const auto& row : table) {
      generation->chunks.push_back(row.get<Chunk>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw IndexFormatError("Corrupt chunk table in " + path.string() + ": " + e.what());
  }

  install(std::move(generation));
  std::cout << "Vector index loaded from " << path << " (" << count << " vectors, dimension "
            << file_dimension << ")" << std::endl;
  return true;
}

void VectorIndex::reset() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  std::lock_guard<std::mutex> lock(generation_mutex_);
  generation_.reset();
  dimension_ = config_.dimension;
}

size_t VectorIndex::size() const {
  auto generation = snapshot();
  return generation ? generation->chunks.size() : 0;
}

bool VectorIndex::empty() const {
  return size() == 0;
}

size_t VectorIndex::dimension() const {
  std::lock_guard<std::mutex> lock(generation_mutex_);
  return dimension_;
}

IndexStats VectorIndex::stats() const {
  IndexStats stats;
  auto generation = snapshot();
  stats.index_type = to_string(generation ? generation->kind : config_.kind);
  stats.dimension = dimension();
  if (!generation) {
    return stats;
  }
  stats.total_vectors = static_cast<size_t>(generation->index->ntotal);
  stats.index_size_bytes = stats.total_vectors * generation->dimension * sizeof(float);
  stats.is_trained = generation->index->is_trained;
  return stats;
}

/* Wrapper for faiss search with per-call HNSW parameters so concurrent searches share no
   mutable state */
void VectorIndex::search_faiss_index(const Generation& generation,
                                     const std::vector<float>& query_vector,
                                     size_t k,
                                     std::vector<float>& distances,
                                     std::vector<faiss::idx_t>& labels) const {
  if (generation.kind == IndexKind::HNSW) {
    faiss::SearchParametersHNSW params;
    params.efSearch = std::max(config_.hnsw_ef_search, static_cast<int>(k));
    generation.index->search(1, query_vector.data(), static_cast<faiss::idx_t>(k),
                             distances.data(), labels.data(), &params);
  } else {
    generation.index->search(1, query_vector.data(), static_cast<faiss::idx_t>(k),
                             distances.data(), labels.data());
  }
}

std::unique_ptr<faiss::Index> VectorIndex::create_base_index(IndexKind kind,
                                                             size_t dimension) const {
  const int d = static_cast<int>(dimension);
  if (kind == IndexKind::Flat) {
    return std::make_unique<faiss::IndexFlatIP>(d);
  }
  auto base_index =
      std::make_unique<faiss::IndexHNSWFlat>(d, config_.hnsw_m, faiss::METRIC_INNER_PRODUCT);
  base_index->hnsw.efConstruction = config_.hnsw_ef_construction;
  return base_index;
}

}  // namespace rag_core
