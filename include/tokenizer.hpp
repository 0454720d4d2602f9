#ifndef TOKENIZER_HPP
#define TOKENIZER_HPP

#include <string>
#include <vector>

// Splits corpus text into lower-cased words and single-character punctuation
// tokens. Lines are split on single spaces only; the corpus is expected to be
// cleaned beforehand.
struct WordTokenizer {
  static const std::string punctuation;
  static const std::string newline_token;

  static bool is_punctuation(const std::string &token);
  static bool is_punctuation(char c);

  // appends the tokens of one line (without its line terminator) to out
  void tokenize_line(const std::string &line,
                     std::vector<std::string> &out) const;
  std::vector<std::string> tokenize(const std::string &text) const;

 private:
  void tokenize_piece(const std::string &piece,
                      std::vector<std::string> &out) const;
};

// Reads and tokenizes a whole corpus file, optionally drawing a per-line
// progress bar.
std::vector<std::string> load_corpus_tokens(const std::string &filename,
                                            bool show_progress = false);

#endif
