#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace almanac::test {
namespace {

class ConfigTest : public CliTestFixture {};

TEST_F(ConfigTest, FailsWithoutConfigOrFile) {
  auto result = Run({"solve"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no input file")) << result.output;
}

TEST_F(ConfigTest, CheckFailsWithoutConfigOrFile) {
  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no input file")) << result.output;
}

TEST_F(ConfigTest, UsesConfiguredDataset) {
  WriteSample("sample.txt");
  WriteAlmanacToml("sample.txt");

  auto result = Run({"solve"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("minimal location: 35")) << result.output;
}

// The config is found from a subdirectory and its path resolves against the
// directory holding almanac.toml.
TEST_F(ConfigTest, FindsConfigInParentDirectory) {
  WriteSample("sample.txt");
  WriteAlmanacToml("sample.txt");
  WriteFile("nested/deeper/.keep", "");

  auto result = RunIn("nested/deeper", {"solve", "--mode", "range"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("minimal location with ranges: 46"))
      << result.output;
}

TEST_F(ConfigTest, CliFileOverridesConfig) {
  WriteSample("sample.txt");
  WriteFile("other.txt", "seeds: 7\nx-to-y map:\n100 0 10\n");
  WriteAlmanacToml("sample.txt");

  auto result = Run({"solve", "--mode", "scalar", "other.txt"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("minimal y: 107")) << result.output;
}

TEST_F(ConfigTest, ModeFromConfig) {
  WriteSample("sample.txt");
  WriteAlmanacToml("sample.txt", "[solve]\nmode = \"scalar\"");

  auto result = Run({"solve"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("minimal location: 35"));
  EXPECT_FALSE(result.Contains("with ranges"));
}

TEST_F(ConfigTest, CliModeOverridesConfig) {
  WriteSample("sample.txt");
  WriteAlmanacToml("sample.txt", "[solve]\nmode = \"scalar\"");

  auto result = Run({"solve", "--mode", "range"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("minimal location with ranges: 46"));
  EXPECT_FALSE(result.Contains("minimal location: 35"));
}

TEST_F(ConfigTest, InvalidModeInConfig) {
  WriteSample("sample.txt");
  WriteAlmanacToml("sample.txt", "[solve]\nmode = \"sometimes\"");

  auto result = Run({"solve"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("unknown mode 'sometimes'")) << result.output;
}

TEST_F(ConfigTest, WarningsAsErrorsFromConfig) {
  WriteFile("data.txt", "seeds: 1 2\nx-to-y map:\n0 5 10\n100 5 3\n");
  WriteAlmanacToml("data.txt", "[diagnostics]\nwarnings_as_errors = true");

  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("duplicate source start")) << result.output;
  EXPECT_TRUE(result.Contains("1 error generated.")) << result.output;
}

TEST_F(ConfigTest, MissingDatasetFile) {
  WriteAlmanacToml("missing.txt");

  auto result = Run({"solve"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("dataset file not found: missing.txt"))
      << result.output;
}

TEST_F(ConfigTest, MissingDatasetSection) {
  WriteFile("almanac.toml", "[solve]\nmode = \"both\"\n");

  auto result = Run({"solve"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("missing [dataset] section")) << result.output;
}

TEST_F(ConfigTest, MalformedToml) {
  WriteFile("almanac.toml", "[dataset\nfile = \n");

  auto result = Run({"solve"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("failed to parse")) << result.output;
}

TEST_F(ConfigTest, ChangeDirectoryFlag) {
  WriteSample("project/sample.txt");
  WriteFile("project/almanac.toml", "[dataset]\nfile = \"sample.txt\"\n");

  auto result = Run({"-C", "project", "solve"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("minimal location: 35")) << result.output;
}

TEST_F(ConfigTest, ChangeDirectoryToMissingDirectory) {
  auto result = Run({"-C", "nowhere", "solve"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("cannot change to 'nowhere'")) << result.output;
}

}  // namespace
}  // namespace almanac::test
