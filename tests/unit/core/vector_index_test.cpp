#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "rag_core/errors.hpp"
#include "rag_core/index/vector_index.hpp"
#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"

namespace rag_core {

using rag_tests::MockUtilities::create_test_chunk;
using rag_tests::MockUtilities::create_test_vector;

class VectorIndexTest : public rag_tests::TempDirTestBase,
                        public ::testing::WithParamInterface<IndexKind> {
 protected:
  VectorIndexConfig config() const {
    VectorIndexConfig config;
    config.kind = GetParam();
    return config;
  }

  // count random vectors of the given dimension, chunk i has chunk_index i
  std::vector<IndexEntry> random_entries(size_t count, size_t dimension = 16) const {
    std::vector<IndexEntry> entries;
    for (size_t i = 0; i < count; ++i) {
      entries.push_back({create_test_vector(static_cast<unsigned int>(i + 1), dimension),
                         create_test_chunk("chunk " + std::to_string(i), static_cast<int>(i))});
    }
    return entries;
  }
};

TEST_P(VectorIndexTest, SearchBeforeBuildReturnsEmpty) {
  VectorIndex index(config());

  EXPECT_TRUE(index.empty());
  EXPECT_EQ(index.dimension(), 0u);
  EXPECT_TRUE(index.search({1.0f, 0.0f, 0.0f}, 5).empty());
}

TEST_P(VectorIndexTest, SelfQueryScoresOne) {
  VectorIndex index(config());
  auto entries = random_entries(20);
  index.build(entries);

  ASSERT_EQ(index.size(), 20u);
  for (const auto& entry : entries) {
    auto hits = index.search(entry.vector, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].chunk.id, entry.chunk.id);
    EXPECT_NEAR(hits[0].score, 1.0f, 1e-4f);
  }
}

TEST_P(VectorIndexTest, ResultsAreSortedByDescendingScore) {
  VectorIndex index(config());
  index.build(random_entries(30));

  auto hits = index.search(create_test_vector(999), 10);

  ASSERT_EQ(hits.size(), 10u);
  for (size_t i = 1; i < hits.size(); ++i) {
    EXPECT_GE(hits[i - 1].score, hits[i].score);
  }
}

TEST_P(VectorIndexTest, ScoresAreCosineSimilarity) {
  VectorIndex index(config());
  auto entries = random_entries(5);
  index.build(entries);
  auto query = create_test_vector(42);

  auto hits = index.search(query, 5);

  ASSERT_EQ(hits.size(), 5u);
  for (const auto& hit : hits) {
    const auto& vector = entries[hit.chunk.chunk_index].vector;
    EXPECT_NEAR(hit.score, rag_tests::MockUtilities::cosine(query, vector), 1e-4f);
  }
}

TEST_P(VectorIndexTest, TopKLargerThanIndexReturnsEverything) {
  VectorIndex index(config());
  index.build(random_entries(3));

  EXPECT_EQ(index.search(create_test_vector(7), 10).size(), 3u);
  EXPECT_TRUE(index.search(create_test_vector(7), 0).empty());
}

TEST_P(VectorIndexTest, EqualScoresAreOrderedByChunkIndex) {
  VectorIndex index(config());
  std::vector<float> same = {1.0f, 0.0f, 0.0f, 0.0f};
  index.build({
      {same, create_test_chunk("third", 3)},
      {{0.0f, 1.0f, 0.0f, 0.0f}, create_test_chunk("other", 9)},
      {same, create_test_chunk("first", 1)},
      {same, create_test_chunk("second", 2)},
  });

  auto hits = index.search({2.0f, 0.0f, 0.0f, 0.0f}, 2);

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk.chunk_index, 1);
  EXPECT_EQ(hits[1].chunk.chunk_index, 2);
  EXPECT_FLOAT_EQ(hits[0].score, hits[1].score);
}

TEST_P(VectorIndexTest, EqualScoresAndChunkIndexKeepInsertionOrder) {
  VectorIndex index(config());
  std::vector<float> same = {0.0f, 0.0f, 1.0f};
  index.build({
      {same, create_test_chunk("from b", 0, "b.md")},
      {same, create_test_chunk("from a", 0, "a.md")},
      {same, create_test_chunk("from c", 0, "c.md")},
  });

  auto hits = index.search(same, 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].chunk.source_file, "b.md");
  EXPECT_EQ(hits[1].chunk.source_file, "a.md");
  EXPECT_EQ(hits[2].chunk.source_file, "c.md");
}

TEST_P(VectorIndexTest, ZeroVectorScoresZero) {
  VectorIndex index(config());
  index.build({
      {{0.0f, 0.0f, 0.0f}, create_test_chunk("empty", 0)},
      {{1.0f, 1.0f, 0.0f}, create_test_chunk("diagonal", 1)},
  });

  auto hits = index.search({1.0f, 0.0f, 0.0f}, 2);

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk.content, "diagonal");
  EXPECT_NEAR(hits[0].score, 0.7071f, 1e-3f);
  EXPECT_EQ(hits[1].chunk.content, "empty");
  EXPECT_FLOAT_EQ(hits[1].score, 0.0f);
}

TEST_P(VectorIndexTest, QueryWithWrongDimensionThrows) {
  VectorIndex index(config());
  index.build(random_entries(4, 8));

  EXPECT_THROW(index.search(create_test_vector(1, 9), 2), DimensionMismatchError);
}

TEST_P(VectorIndexTest, MixedDimensionsAreRejectedAndKeepOldContent) {
  VectorIndex index(config());
  index.build(random_entries(4, 8));

  std::vector<IndexEntry> mixed = {
      {create_test_vector(1, 8), create_test_chunk("a", 0)},
      {create_test_vector(2, 6), create_test_chunk("b", 1)},
  };

  EXPECT_THROW(index.build(mixed), ConfigurationError);
  EXPECT_EQ(index.size(), 4u);
  EXPECT_EQ(index.dimension(), 8u);
}

TEST_P(VectorIndexTest, DimensionIsFixedUntilReset) {
  VectorIndex index(config());
  index.build(random_entries(3, 8));

  EXPECT_THROW(index.build(random_entries(3, 12)), ConfigurationError);

  index.reset();
  EXPECT_TRUE(index.empty());
  EXPECT_EQ(index.dimension(), 0u);
  index.build(random_entries(3, 12));
  EXPECT_EQ(index.dimension(), 12u);
}

TEST_P(VectorIndexTest, ConfiguredDimensionIsEnforced) {
  VectorIndexConfig fixed = config();
  fixed.dimension = 8;
  VectorIndex index(fixed);

  EXPECT_EQ(index.dimension(), 8u);
  EXPECT_THROW(index.build(random_entries(2, 4)), ConfigurationError);
  EXPECT_NO_THROW(index.build(random_entries(2, 8)));
}

TEST_P(VectorIndexTest, RebuildReplacesContent) {
  VectorIndex index(config());
  index.build(random_entries(10));
  index.build(random_entries(3));

  EXPECT_EQ(index.size(), 3u);
  EXPECT_EQ(index.search(create_test_vector(5), 10).size(), 3u);
}

TEST_P(VectorIndexTest, BuildIsIdempotent) {
  VectorIndex index(config());
  auto entries = random_entries(15);
  auto query = create_test_vector(77);

  index.build(entries);
  auto first = index.search(query, 5);
  index.build(entries);
  auto second = index.search(query, 5);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].chunk.id, second[i].chunk.id);
    EXPECT_FLOAT_EQ(first[i].score, second[i].score);
  }
}

TEST_P(VectorIndexTest, EmptyBuildYieldsEmptyIndex) {
  VectorIndex index(config());
  index.build(random_entries(3));

  index.build({});

  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.search(create_test_vector(1), 3).empty());
}

TEST_P(VectorIndexTest, SaveAndLoadRoundTrip) {
  VectorIndex index(config());
  auto entries = random_entries(25);
  entries[3].chunk.metadata["heading_path"] = "Guide > Install";
  index.build(entries);
  auto path = temp_dir_ / "nested" / "main_index.rag";

  ASSERT_TRUE(index.save(path));
  EXPECT_TRUE(std::filesystem::exists(path));

  VectorIndex restored;
  ASSERT_TRUE(restored.load(path));
  EXPECT_EQ(restored.size(), index.size());
  EXPECT_EQ(restored.dimension(), index.dimension());
  EXPECT_EQ(restored.stats().index_type, to_string(GetParam()));

  for (unsigned int seed : {100u, 200u, 300u}) {
    auto query = create_test_vector(seed);
    auto expected = index.search(query, 5);
    auto actual = restored.search(query, 5);
    ASSERT_EQ(expected.size(), actual.size());
    for (size_t i = 0; i < expected.size(); ++i) {
      EXPECT_EQ(expected[i].chunk.id, actual[i].chunk.id);
      EXPECT_EQ(expected[i].chunk.content, actual[i].chunk.content);
      EXPECT_EQ(expected[i].chunk.metadata, actual[i].chunk.metadata);
      EXPECT_NEAR(expected[i].score, actual[i].score, 1e-5f);
    }
  }
}

TEST_P(VectorIndexTest, SaveEmptyIndexReturnsFalse) {
  VectorIndex index(config());

  EXPECT_FALSE(index.save(temp_dir_ / "empty.rag"));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "empty.rag"));
}

TEST_P(VectorIndexTest, LoadMissingFileReturnsFalse) {
  VectorIndex index(config());
  index.build(random_entries(3));

  EXPECT_FALSE(index.load(temp_dir_ / "missing.rag"));
  EXPECT_EQ(index.size(), 3u);
}

TEST_P(VectorIndexTest, LoadGarbageThrowsIndexFormatError) {
  auto path = write_file("garbage.rag", "this is definitely not an index file");
  VectorIndex index(config());

  EXPECT_THROW(index.load(path), IndexFormatError);
  EXPECT_TRUE(index.empty());
}

TEST_P(VectorIndexTest, LoadTruncatedFileThrowsIndexFormatError) {
  VectorIndex index(config());
  index.build(random_entries(10));
  auto path = temp_dir_ / "index.rag";
  ASSERT_TRUE(index.save(path));

  std::string bytes = rag_tests::TestUtilities::read_file(path);
  write_file("truncated.rag", bytes.substr(0, bytes.size() / 2));

  VectorIndex restored;
  EXPECT_THROW(restored.load(temp_dir_ / "truncated.rag"), IndexFormatError);
}

TEST_P(VectorIndexTest, LoadWithOtherDimensionThrowsIndexFormatError) {
  VectorIndex index(config());
  index.build(random_entries(5, 4));
  auto path = temp_dir_ / "index.rag";
  ASSERT_TRUE(index.save(path));

  VectorIndexConfig fixed = config();
  fixed.dimension = 8;
  VectorIndex restored(fixed);
  EXPECT_THROW(restored.load(path), IndexFormatError);

  VectorIndex built(config());
  built.build(random_entries(2, 6));
  EXPECT_THROW(built.load(path), IndexFormatError);
  EXPECT_EQ(built.size(), 2u);
}

TEST_P(VectorIndexTest, StatsDescribeContent) {
  VectorIndex index(config());
  index.build(random_entries(7, 16));

  IndexStats stats = index.stats();

  EXPECT_EQ(stats.total_vectors, 7u);
  EXPECT_EQ(stats.dimension, 16u);
  EXPECT_EQ(stats.index_size_bytes, 7u * 16u * sizeof(float));
  EXPECT_EQ(stats.index_type, to_string(GetParam()));
  EXPECT_TRUE(stats.is_trained);
}

TEST_P(VectorIndexTest, SearchesRunWhileIndexIsRebuilt) {
  VectorIndex index(config());
  auto small = random_entries(5);
  auto large = random_entries(40);
  index.build(small);

  std::atomic<bool> done{false};
  std::atomic<int> bad_results{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&, t]() {
      auto query = create_test_vector(500 + t);
      while (!done.load()) {
        auto hits = index.search(query, 3);
        if (hits.size() != 3) {
          ++bad_results;
        }
      }
    });
  }

  for (int i = 0; i < 10; ++i) {
    index.build(i % 2 == 0 ? large : small);
  }
  done = true;
  for (auto& reader : readers) {
    reader.join();
  }

  EXPECT_EQ(bad_results.load(), 0);
}

INSTANTIATE_TEST_SUITE_P(IndexKinds,
                         VectorIndexTest,
                         ::testing::Values(IndexKind::Flat, IndexKind::HNSW),
                         [](const ::testing::TestParamInfo<IndexKind>& info) {
                           return to_string(info.param);
                         });

TEST(IndexKindTest, ParsesKnownNames) {
  EXPECT_EQ(index_kind_from_string("flat"), IndexKind::Flat);
  EXPECT_EQ(index_kind_from_string("hnsw"), IndexKind::HNSW);
  EXPECT_THROW(index_kind_from_string("ivf"), ConfigurationError);
}

TEST(VectorIndexConfigTest, RejectsNonPositiveHnswParameters) {
  VectorIndexConfig config;
  config.hnsw_m = 0;
  EXPECT_THROW(VectorIndex index(config), ConfigurationError);
}

}  // namespace rag_core
