#include "tokenizer.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using Tokens = std::vector<std::string>;

TEST(WordTokenizer, SplitsPunctuationFromWords) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("the cat sat. the dog ran."),
            (Tokens{"the", "cat", "sat", ".", "the", "dog", "ran", "."}));
}

TEST(WordTokenizer, LowerCasesWords) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("The MOON Rises"),
            (Tokens{"the", "moon", "rises"}));
}

TEST(WordTokenizer, EmitsEveryPunctuationMarkInOrder) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("wait,what?!"),
            (Tokens{"waitwhat", ",", "?", "!"}));
  EXPECT_EQ(tokenizer.tokenize("..."), (Tokens{".", ".", "."}));
}

TEST(WordTokenizer, SkipsEmptyPiecesFromRepeatedSpaces) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("  a   b "), (Tokens{"a", "b"}));
}

TEST(WordTokenizer, DoesNotSplitOnTabs) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("a\tb c"), (Tokens{"a\tb", "c"}));
}

TEST(WordTokenizer, JoinsLinesWithoutNewlineTokens) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("roses are red,\r\nviolets are blue\n"),
            (Tokens{"roses", "are", "red", ",", "violets", "are", "blue"}));
}

TEST(WordTokenizer, LeavesUtf8BytesUntouched) {
  WordTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("Caf\xc3\xa9 \xc3\x89t\xc3\xa9."),
            (Tokens{"caf\xc3\xa9", "\xc3\x89t\xc3\xa9", "."}));
}

TEST(WordTokenizer, PunctuationPredicate) {
  EXPECT_TRUE(WordTokenizer::is_punctuation("."));
  EXPECT_TRUE(WordTokenizer::is_punctuation(","));
  EXPECT_TRUE(WordTokenizer::is_punctuation("!"));
  EXPECT_TRUE(WordTokenizer::is_punctuation("?"));
  EXPECT_FALSE(WordTokenizer::is_punctuation(";"));
  EXPECT_FALSE(WordTokenizer::is_punctuation(".."));
  EXPECT_FALSE(WordTokenizer::is_punctuation(""));
  EXPECT_FALSE(WordTokenizer::is_punctuation(WordTokenizer::newline_token));
}

TEST(CorpusLoading, ReadsFileIntoTokens) {
  const std::string path = "tokenizer_test_corpus.txt";
  {
    std::ofstream out(path);
    out << "The cat sat.\nThe dog ran.";
  }
  EXPECT_EQ(load_corpus_tokens(path),
            (Tokens{"the", "cat", "sat", ".", "the", "dog", "ran", "."}));
  std::remove(path.c_str());
}

TEST(CorpusLoading, EmptyFileGivesNoTokens) {
  const std::string path = "tokenizer_test_empty.txt";
  { std::ofstream out(path); }
  EXPECT_TRUE(load_corpus_tokens(path).empty());
  std::remove(path.c_str());
}

TEST(CorpusLoading, MissingFileThrows) {
  EXPECT_THROW(load_corpus_tokens("does/not/exist.txt"), std::runtime_error);
}
