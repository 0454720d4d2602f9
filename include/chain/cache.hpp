#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "chain/transition_table.hpp"

namespace chain {

constexpr const char *kDefaultCachePath = "hashtable_cache.ser";
constexpr const char *kCacheFormat = "versewalk-transition-table";
constexpr int kCacheVersion = 1;

// Writes every record (word, count, ordered follow list) as a MessagePack
// document tagged with kCacheFormat/kCacheVersion. Returns false and logs on
// any failure.
bool save_table(const TransitionTable &table,
                const std::string &path = kDefaultCachePath);

// Returns std::nullopt (after logging) if the file is missing, unreadable,
// malformed, of another format or version, or inconsistent.
std::optional<TransitionTable> load_table(
    const std::string &path = kDefaultCachePath);

bool cache_exists(const std::string &path = kDefaultCachePath);
size_t cache_file_size(const std::string &path = kDefaultCachePath);

}  // namespace chain
