#include "chain/cache.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chain {

namespace {

json table_to_json(const TransitionTable &table) {
  json entries = json::array();
  table.for_each([&](const std::string &word, const WordFreqInfo &info) {
    entries.push_back(json{{"word", word},
                           {"count", info.occur_count()},
                           {"follows", info.follow_words()}});
  });
  return json{{"format", kCacheFormat},
              {"version", kCacheVersion},
              {"entries", std::move(entries)}};
}

TransitionTable table_from_json(const json &doc) {
  if (!doc.is_object()) {
    throw std::runtime_error("cache root is not an object");
  }
  if (doc.at("format").get<std::string>() != kCacheFormat) {
    throw std::runtime_error("unknown cache format '" +
                             doc.at("format").get<std::string>() + "'");
  }
  int version = doc.at("version").get<int>();
  if (version != kCacheVersion) {
    throw std::runtime_error("unsupported cache version " +
                             std::to_string(version));
  }

  const json &entries = doc.at("entries");
  if (!entries.is_array()) {
    throw std::runtime_error("cache entries are not an array");
  }
  TransitionTable table;
  table.reserve(entries.size());
  for (const auto &entry : entries) {
    auto word = entry.at("word").get<std::string>();
    auto count = entry.at("count").get<size_t>();
    auto follows = entry.at("follows").get<std::vector<std::string>>();
    if (count == 0 || count != follows.size()) {
      throw std::runtime_error("record '" + word + "' has count " +
                               std::to_string(count) + " but " +
                               std::to_string(follows.size()) + " follows");
    }
    if (!table.insert(word, WordFreqInfo(word, std::move(follows)))) {
      throw std::runtime_error("duplicate record '" + word + "'");
    }
  }
  return table;
}

}  // namespace

bool save_table(const TransitionTable &table, const std::string &path) {
  std::vector<std::uint8_t> bytes;
  try {
    bytes = json::to_msgpack(table_to_json(table));
  } catch (const json::exception &e) {
    std::cerr << "Error saving hash table: " << e.what() << std::endl;
    return false;
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    std::cerr << "Error saving hash table: could not open " << path
              << " for writing" << std::endl;
    return false;
  }
  file.write(reinterpret_cast<const char *>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    std::cerr << "Error saving hash table: write to " << path << " failed"
              << std::endl;
    return false;
  }
  return true;
}

std::optional<TransitionTable> load_table(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "Error loading hash table: could not open " << path
              << std::endl;
    return std::nullopt;
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
  if (file.bad()) {
    std::cerr << "Error loading hash table: read from " << path << " failed"
              << std::endl;
    return std::nullopt;
  }

  try {
    return table_from_json(json::from_msgpack(bytes));
  } catch (const json::exception &e) {
    std::cerr << "Error loading hash table: " << e.what() << std::endl;
  } catch (const std::runtime_error &e) {
    std::cerr << "Error loading hash table: " << e.what() << std::endl;
  }
  return std::nullopt;
}

bool cache_exists(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  return file.good();
}

size_t cache_file_size(const std::string &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) return 0;
  auto size = file.tellg();
  return size > 0 ? static_cast<size_t>(size) : 0;
}

}  // namespace chain
