#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace pc {
namespace utl {

class UtilitiesFileTest : public ::testing::Test {
protected:
  std::filesystem::path testDir;

  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() / "powchain_utilities_test";
    std::filesystem::remove_all(testDir);
  }

  void TearDown() override { std::filesystem::remove_all(testDir); }
};

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, AbcProducesKnownHash) {
  EXPECT_EQ(sha256("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsLowercaseHex64Characters) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexEncodeTest, EncodesBytes) {
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xff", 3)), "000fff");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(GetCurrentTimeTest, ReturnsPlausibleSeconds) {
  // 2020-01-01
  EXPECT_GT(getCurrentTime(), 1577836800);
}

TEST_F(UtilitiesFileTest, WriteThenLoadJson) {
  std::string path = (testDir / "nested" / "data.json").string();
  auto written = writeToFile(path, R"({"b": 1, "a": [true, "x"]})");
  ASSERT_TRUE(written.isOk()) << written.error().message;

  auto loaded = loadJsonFile(path);
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(loaded->dump(), R"({"b":1,"a":[true,"x"]})");
}

TEST_F(UtilitiesFileTest, WriteReplacesContent) {
  std::string path = (testDir / "replace.txt").string();
  ASSERT_TRUE(writeToFile(path, "first version").isOk());
  ASSERT_TRUE(writeToFile(path, "second").isOk());

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "second");
}

TEST_F(UtilitiesFileTest, LoadMissingFileFails) {
  auto result = loadJsonFile((testDir / "missing.json").string());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
}

TEST_F(UtilitiesFileTest, LoadMalformedJsonFails) {
  std::string path = (testDir / "bad.json").string();
  ASSERT_TRUE(writeToFile(path, "{not json").isOk());
  auto result = loadJsonFile(path);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);
}

} // namespace utl
} // namespace pc
