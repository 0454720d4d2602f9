#include "poem/writer.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "chain/cache.hpp"
#include "nlohmann/json.hpp"

namespace {

class PoemWriterTest : public ::testing::Test {
 protected:
  poem::PoemConfig config;

  void SetUp() override {
    const std::string name =
        ::testing::UnitTest::GetInstance()->current_test_info()->name();
    config.corpus_path = "writer_test_" + name + ".txt";
    config.cache_path = "writer_test_" + name + ".ser";
    config.seed = 99;
    config.show_progress = false;
    write_corpus("The cat sat.\nThe dog ran.\n");
  }

  void TearDown() override {
    std::remove(config.corpus_path.c_str());
    std::remove(config.cache_path.c_str());
  }

  void write_corpus(const std::string& text) {
    std::ofstream out(config.corpus_path);
    out << text;
  }
};

}  // namespace

TEST_F(PoemWriterTest, BuildsAndCachesWhenNoCacheExists) {
  auto table = poem::obtain_table(config);
  EXPECT_EQ(table.size(), 6u);
  EXPECT_TRUE(chain::cache_exists(config.cache_path));
}

TEST_F(PoemWriterTest, ReusesCacheEvenAfterCorpusChanges) {
  poem::obtain_table(config);
  write_corpus("completely different words here\n");
  auto table = poem::obtain_table(config);
  EXPECT_NE(table.find("the"), nullptr);
  EXPECT_EQ(table.find("different"), nullptr);
}

TEST_F(PoemWriterTest, RebuildIgnoresCache) {
  poem::obtain_table(config);
  write_corpus("completely different words here\n");
  auto table = poem::rebuild_table(config);
  EXPECT_NE(table.find("different"), nullptr);
  EXPECT_EQ(table.find("the"), nullptr);

  auto cached = chain::load_table(config.cache_path);
  ASSERT_TRUE(cached.has_value());
  EXPECT_NE(cached->find("different"), nullptr);
}

TEST_F(PoemWriterTest, CorruptCacheFallsBackToCorpus) {
  {
    std::ofstream out(config.cache_path, std::ios::binary);
    out << "not a cache";
  }
  auto table = poem::obtain_table(config);
  EXPECT_EQ(table.size(), 6u);
  EXPECT_TRUE(chain::load_table(config.cache_path).has_value());
}

TEST_F(PoemWriterTest, CacheDisabledLeavesNoFile) {
  config.use_cache = false;
  auto table = poem::obtain_table(config);
  EXPECT_EQ(table.size(), 6u);
  EXPECT_FALSE(chain::cache_exists(config.cache_path));
}

TEST_F(PoemWriterTest, EmptyCorpusFailsFast) {
  write_corpus("");
  EXPECT_THROW(poem::obtain_table(config), std::runtime_error);
}

TEST_F(PoemWriterTest, MissingCorpusThrows) {
  config.corpus_path = "writer_test_missing.txt";
  EXPECT_THROW(poem::obtain_table(config), std::runtime_error);
}

TEST_F(PoemWriterTest, SeededPoemsRepeat) {
  auto table = poem::obtain_table(config);
  auto first = poem::write_poem(table, "the", 8, config);
  auto second = poem::write_poem(table, "the", 8, config);
  EXPECT_EQ(first.text, second.text);
  EXPECT_EQ(first.text.rfind("the", 0), 0u);
}

TEST_F(PoemWriterTest, SummaryListsMostFrequentWords) {
  auto table = poem::obtain_table(config);
  const std::string path = "writer_test_summary.json";
  poem::dump_table_summary(table, path, 2);

  std::ifstream in(path);
  ASSERT_TRUE(in.is_open());
  std::stringstream ss;
  ss << in.rdbuf();
  auto doc = nlohmann::json::parse(ss.str());
  EXPECT_EQ(doc.at("unique_words").get<size_t>(), 6u);
  ASSERT_EQ(doc.at("top").size(), 2u);
  EXPECT_EQ(doc.at("top")[0].at("word").get<std::string>(), "the");
  EXPECT_EQ(doc.at("top")[0].at("count").get<size_t>(), 2u);
  EXPECT_EQ(doc.at("top")[0].at("distinct_follows").get<size_t>(), 2u);
  std::remove(path.c_str());
}

TEST(PoemConfig, ReadsEnvironmentOverrides) {
  setenv("POEM_CORPUS", "poems.txt", 1);
  setenv("POEM_SEED", "17", 1);
  setenv("POEM_USE_CACHE", "0", 1);
  unsetenv("POEM_CACHE");
  unsetenv("POEM_PROGRESS");
  auto cfg = poem::PoemConfig::from_env();
  unsetenv("POEM_CORPUS");
  unsetenv("POEM_SEED");
  unsetenv("POEM_USE_CACHE");

  EXPECT_EQ(cfg.corpus_path, "poems.txt");
  EXPECT_EQ(cfg.cache_path, chain::kDefaultCachePath);
  EXPECT_EQ(cfg.seed, 17u);
  EXPECT_FALSE(cfg.use_cache);
  EXPECT_TRUE(cfg.show_progress);
}
