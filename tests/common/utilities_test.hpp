#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace rag_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Fresh, empty directory under the system temp directory
  static std::filesystem::path create_temp_dir(const std::string& prefix);
  static void cleanup_temp_dir(const std::filesystem::path& dir);

  static std::filesystem::path write_file(const std::filesystem::path& dir,
                                          const std::string& filename,
                                          const std::string& content);
  static std::string read_file(const std::filesystem::path& path);
};

/**
 * Base test fixture that provides a scratch directory per test
 */
class TempDirTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("rag_tests");
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path write_file(const std::string& filename, const std::string& content) {
    return TestUtilities::write_file(temp_dir_, filename, content);
  }

  std::filesystem::path temp_dir_;
};

}  // namespace rag_tests
