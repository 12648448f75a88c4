#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(std::string_view text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Test fixture for CLI integration tests
//
// Each test gets a fresh temporary directory. The almanac binary is taken
// from $ALMANAC_BIN, falling back to the path the build compiled in.
//
// Usage:
//   TEST_F(SolveTest, Sample) {
//     WriteSample("data.txt");
//     auto result = Run({"solve", "data.txt"});
//     EXPECT_TRUE(result.Contains("minimal location: 35"));
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run almanac with given arguments from the test directory
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run almanac from a directory relative to the test directory
  auto RunIn(
      const std::filesystem::path& relative_dir,
      const std::vector<std::string>& args) -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, std::string_view content);

  // Write the seven-stage sample almanac
  void WriteSample(const std::filesystem::path& relative_path);

  // Create an almanac.toml naming `dataset_file`, plus any extra lines
  void WriteAlmanacToml(
      const std::string& dataset_file, const std::string& extra = "");

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path almanac_bin_;
};

}  // namespace almanac::test
