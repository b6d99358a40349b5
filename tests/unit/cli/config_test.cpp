#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "plaintext_cli/config.hpp"
#include "utilities_test.hpp"

namespace plaintext_cli {

class ConfigTest : public plaintext_tests::TempDirTestBase {};

TEST_F(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.preview_kb, 0);
  EXPECT_EQ(cfg.read_chunk_size, 1024);
  EXPECT_FALSE(cfg.verbose);

  Config defaults = Config::defaults();
  EXPECT_EQ(defaults.preview_kb, cfg.preview_kb);
  EXPECT_EQ(defaults.read_chunk_size, cfg.read_chunk_size);
}

TEST_F(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"preview_kb", 64}, {"read_chunk_size", 4096}, {"verbose", true}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.preview_kb, 64);
  EXPECT_EQ(cfg.read_chunk_size, 4096);
  EXPECT_TRUE(cfg.verbose);
  EXPECT_EQ(cfg.classifier_options().read_chunk_size, 4096u);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json({{"preview_kb", -1}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"read_chunk_size", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"preview_kb", "large"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::array({1, 2})), std::runtime_error);
}

TEST_F(ConfigTest, RejectsNonIntegerAndOutOfRangeNumbers) {
  EXPECT_THROW(Config::from_json({{"read_chunk_size", 4294967297LL}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"read_chunk_size", 1.5}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"preview_kb", 2147483648LL}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"preview_kb", -4294967296LL}}), std::runtime_error);

  auto path = create_test_file("wide.json", R"({"read_chunk_size": 18446744073709551615})");
  try {
    Config::from_file(path.string());
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("read_chunk_size is out of range"));
  }

  Config cfg = Config::from_json({{"preview_kb", 2147483647LL}});
  EXPECT_EQ(cfg.preview_kb, 2147483647);
}

TEST_F(ConfigTest, LoadsFromFile) {
  auto path = create_test_file("config.json", R"({"preview_kb": 8, "verbose": true})");

  Config cfg = Config::from_file(path.string());

  EXPECT_EQ(cfg.preview_kb, 8);
  EXPECT_EQ(cfg.read_chunk_size, 1024);
  EXPECT_TRUE(cfg.verbose);
}

TEST_F(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(Config::from_file((test_dir_ / "nope.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
  auto path = create_test_file("broken.json", "{\"preview_kb\": ");

  try {
    Config::from_file(path.string());
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("Failed to parse JSON"));
  }
}

}  // namespace plaintext_cli
