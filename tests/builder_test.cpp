#include "chain/builder.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "tokenizer.hpp"

using Tokens = std::vector<std::string>;

TEST(ChainBuilder, RecordsFollowersOfEachWord) {
  WordTokenizer tokenizer;
  auto table = chain::build_transition_table(
      tokenizer.tokenize("the cat sat. the dog ran."));

  const auto* the = table.find("the");
  ASSERT_NE(the, nullptr);
  EXPECT_EQ(the->occur_count(), 2u);
  EXPECT_EQ(the->follow_words(), (Tokens{"cat", "dog"}));

  const auto* period = table.find(".");
  ASSERT_NE(period, nullptr);
  EXPECT_EQ(period->follow_words(), (Tokens{"the"}));

  // the final token is never a predecessor
  EXPECT_EQ(table.size(), 6u);
  EXPECT_EQ(table.find("ran")->follow_words(), (Tokens{"."}));
}

TEST(ChainBuilder, CountsMatchPairOccurrences) {
  const Tokens tokens = {"a", "b", "a", "b", "a", "c", "a"};
  auto table = chain::build_transition_table(tokens);

  std::map<std::string, size_t> expected;
  for (size_t i = 0; i + 1 < tokens.size(); ++i) ++expected[tokens[i]];

  EXPECT_EQ(table.size(), expected.size());
  for (const auto& entry : expected) {
    const auto* info = table.find(entry.first);
    ASSERT_NE(info, nullptr) << entry.first;
    EXPECT_EQ(info->occur_count(), entry.second);
    EXPECT_EQ(info->follow_words().size(), entry.second);
  }
  EXPECT_EQ(table.find("a")->follow_words(), (Tokens{"b", "b", "c"}));
}

TEST(ChainBuilder, TooFewTokensGiveEmptyTable) {
  EXPECT_TRUE(chain::build_transition_table({}).empty());
  EXPECT_TRUE(chain::build_transition_table({"alone"}).empty());
}

TEST(ChainBuilder, PreSizesForLargeInputs) {
  Tokens tokens;
  for (int i = 0; i < 20000; ++i) {
    tokens.push_back("w" + std::to_string(i % 3000));
  }
  auto table = chain::build_transition_table(tokens);
  EXPECT_EQ(table.size(), 3000u);
  EXPECT_LE(table.load_factor(), chain::TransitionTable::kMaxLoadFactor);
  for (int i = 0; i < 3000; ++i) {
    ASSERT_NE(table.find("w" + std::to_string(i)), nullptr);
  }
}
