#include "tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "data/text.hpp"
#include "progress.hpp"

const std::string WordTokenizer::punctuation = ".,!?";
const std::string WordTokenizer::newline_token = "\n";

bool WordTokenizer::is_punctuation(char c) {
  return punctuation.find(c) != std::string::npos;
}

bool WordTokenizer::is_punctuation(const std::string &token) {
  return token.size() == 1 && is_punctuation(token[0]);
}

void WordTokenizer::tokenize_piece(const std::string &piece,
                                   std::vector<std::string> &out) const {
  std::string word;
  std::string marks;
  word.reserve(piece.size());
  for (char c : piece) {
    auto uc = static_cast<unsigned char>(c);
    // bytes >= 0x80 belong to UTF-8 sequences and are left untouched
    char lower = uc < 0x80 ? static_cast<char>(std::tolower(uc)) : c;
    if (is_punctuation(lower)) {
      marks.push_back(lower);
    } else {
      word.push_back(lower);
    }
  }
  if (!word.empty()) out.push_back(word);
  for (char m : marks) out.emplace_back(1, m);
}

void WordTokenizer::tokenize_line(const std::string &line,
                                  std::vector<std::string> &out) const {
  size_t end = line.size();
  if (end > 0 && line[end - 1] == '\r') --end;
  size_t start = 0;
  while (start <= end) {
    size_t space = line.find(' ', start);
    if (space == std::string::npos || space > end) space = end;
    if (space > start) tokenize_piece(line.substr(start, space - start), out);
    start = space + 1;
  }
}

std::vector<std::string> WordTokenizer::tokenize(
    const std::string &text) const {
  std::vector<std::string> tokens;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    tokenize_line(line, tokens);
  }
  return tokens;
}

std::vector<std::string> load_corpus_tokens(const std::string &filename,
                                            bool show_progress) {
  auto text = load_text_data(filename);
  auto total_lines = static_cast<size_t>(
      std::count(text.begin(), text.end(), '\n'));
  if (!text.empty() && text.back() != '\n') ++total_lines;
  ProgressBar progress("Reading", total_lines, std::cout, show_progress);

  WordTokenizer tokenizer;
  std::vector<std::string> tokens;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    tokenizer.tokenize_line(line, tokens);
    progress.increment();
  }
  progress.finish();
  return tokens;
}
