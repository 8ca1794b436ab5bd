#include <gtest/gtest.h>
#include <set>
#include <string>
#include "storage/naming.hpp"
#include "storage/storage_error.hpp"

using namespace vault::storage;

namespace {

std::chrono::system_clock::time_point at_millis(long long millis) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

} // namespace

TEST(NameGeneratorTest, EmbedsTimestampDisambiguatorAndOriginalName) {
  // 2024-01-02T03:04:05.006Z
  NameGenerator generator([] { return at_millis(1704164645006LL); });

  std::string stored = generator.generate("report.pdf");

  ASSERT_EQ(stored.substr(0, 25), "2024-01-02T03-04-05-006Z_");
  ASSERT_EQ(stored.size(), 25u + 8u + 1u + std::string("report.pdf").size());
  EXPECT_EQ(stored[33], '_');
  EXPECT_EQ(stored.substr(34), "report.pdf");
  EXPECT_TRUE(is_generated_name(stored));
}

TEST(NameGeneratorTest, SameNameSameInstantDoesNotCollide) {
  NameGenerator generator([] { return at_millis(1704164645006LL); });

  std::set<std::string> names;
  for (int i = 0; i < 200; ++i) {
    names.insert(generator.generate("photo.jpg"));
  }
  EXPECT_EQ(names.size(), 200u);
}

TEST(NameGeneratorTest, NamesSortChronologically) {
  long long now = 1704164645006LL;
  NameGenerator generator([&now] { return at_millis(now); });

  std::string earlier = generator.generate("b.txt");
  now += 1500;
  std::string later = generator.generate("a.txt");
  EXPECT_LT(earlier, later);
}

TEST(NameGeneratorTest, StripsDirectoryComponents) {
  NameGenerator generator;
  EXPECT_EQ(parse_original_name(generator.generate("/tmp/uploads/data.csv")), "data.csv");
  EXPECT_EQ(parse_original_name(generator.generate("C:\\Users\\me\\notes.txt")), "notes.txt");
}

TEST(NameGeneratorTest, RejectsUnusableNames) {
  NameGenerator generator;
  EXPECT_THROW(generator.generate(""), InvalidArgumentError);
  EXPECT_THROW(generator.generate("dir/"), InvalidArgumentError);
  EXPECT_THROW(generator.generate(".."), InvalidArgumentError);
  EXPECT_THROW(generator.generate("a/.."), InvalidArgumentError);
}

TEST(NameGeneratorTest, RejectsNamesThatCannotFitOnDisk) {
  NameGenerator generator;
  EXPECT_THROW(generator.generate(std::string(230, 'a') + ".txt"), InvalidArgumentError);
  EXPECT_THROW(generator.generate(std::string(MAX_ORIGINAL_NAME_LENGTH + 1, 'a')), InvalidArgumentError);

  std::string longest(MAX_ORIGINAL_NAME_LENGTH, 'a');
  std::string stored = generator.generate("dir/" + longest);
  EXPECT_EQ(parse_original_name(stored), longest);
  EXPECT_EQ(stored.size() + TEMP_AFFIX_LENGTH, MAX_ENTRY_NAME_LENGTH);
}

TEST(NameParserTest, RecoversNameContainingSeparator) {
  NameGenerator generator;
  const std::string original = "my_holiday_photo.final.jpeg";
  EXPECT_EQ(parse_original_name(generator.generate(original)), original);
}

TEST(NameParserTest, LegacyNamesComeBackUnchanged) {
  EXPECT_EQ(parse_original_name("legacy.txt"), "legacy.txt");
  EXPECT_EQ(parse_original_name("two_tokens.txt"), "two_tokens.txt");
  EXPECT_EQ(parse_original_name(""), "");
  EXPECT_FALSE(is_generated_name("legacy.txt"));
}

TEST(NameParserTest, DropsExactlyTwoLeadingTokens) {
  EXPECT_EQ(parse_original_name("a_b_c"), "c");
  EXPECT_EQ(parse_original_name("a_b_c_d"), "c_d");
  EXPECT_EQ(parse_original_name("a_b__"), "_");
  EXPECT_FALSE(is_generated_name("a_b_c"));
}
