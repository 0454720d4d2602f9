/**
 * @file hash_table.hpp
 * @brief Open-addressed hash table used as the Markov chain transition store.
 *
 * Entries live directly in a power-of-two sized slot vector. Collisions are
 * resolved with triangular-number quadratic probing, which visits every slot
 * exactly once for power-of-two capacities. Entries are never erased, so a
 * slot is either Empty or Occupied (no tombstones).
 */

#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chain {

/**
 * @enum SlotState
 * @brief Occupancy tag of a single slot.
 */
enum class SlotState {
  Empty,    ///< Never written
  Occupied  ///< Holds a key/value pair
};

/**
 * @class HashTable
 * @brief Insert/find associative store with automatic doubling.
 * @tparam K Key type
 * @tparam V Value type
 * @tparam Hash Hash functor for K
 */
template <typename K, typename V, typename Hash = std::hash<K>>
struct HashTable {
  struct Slot {
    SlotState state = SlotState::Empty;
    K key{};
    V value{};
  };

  static constexpr size_t kMinCapacity = 8;
  static constexpr float kMaxLoadFactor = 0.5f;

  /**
   * @brief Construct an empty table.
   * @param initial_capacity Requested slot count, rounded up to a power of two
   */
  explicit HashTable(size_t initial_capacity = kMinCapacity)
      : slots(round_up_pow2(initial_capacity)) {}

  /**
   * @brief Slot index for a given probe attempt.
   *
   * index = (hash + attempt * (attempt + 1) / 2) mod capacity. The capacity
   * must be a power of two.
   */
  static size_t probe_index(size_t hash, size_t attempt, size_t capacity) {
    return (hash + attempt * (attempt + 1) / 2) & (capacity - 1);
  }

  static size_t round_up_pow2(size_t n) {
    size_t cap = kMinCapacity;
    while (cap < n) cap <<= 1;
    return cap;
  }

  /**
   * @brief Insert a new key.
   * @return false if the key is already present (the table is unchanged)
   */
  bool insert(const K& key, V value) {
    if (find(key) != nullptr) return false;
    if (static_cast<float>(count + 1) >
        static_cast<float>(slots.size()) * kMaxLoadFactor) {
      resize();
    }
    place(slots, key, std::move(value));
    ++count;
    return true;
  }

  /**
   * @brief Look up a key.
   * @return Pointer to the stored value, or nullptr if absent
   */
  V* find(const K& key) {
    size_t idx = locate(key);
    return idx == kNotFound ? nullptr : &slots[idx].value;
  }

  const V* find(const K& key) const {
    size_t idx = locate(key);
    return idx == kNotFound ? nullptr : &slots[idx].value;
  }

  bool contains(const K& key) const { return find(key) != nullptr; }

  size_t size() const { return count; }
  bool empty() const { return count == 0; }
  size_t capacity() const { return slots.size(); }
  float load_factor() const {
    return static_cast<float>(count) / static_cast<float>(slots.size());
  }

  /**
   * @brief Grow so that n entries fit under the load factor. Never shrinks.
   */
  void reserve(size_t n) {
    size_t needed = round_up_pow2(
        static_cast<size_t>(static_cast<float>(n) / kMaxLoadFactor) + 1);
    if (needed > slots.size()) rehash(needed);
  }

  /**
   * @brief Double the capacity and re-insert every occupied entry.
   */
  void resize() { rehash(slots.size() * 2); }

  /**
   * @brief Visit every occupied entry in slot order.
   * @param fn Callable taking (const K&, const V&)
   */
  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (const auto& slot : slots) {
      if (slot.state == SlotState::Occupied) fn(slot.key, slot.value);
    }
  }

 private:
  std::vector<Slot> slots;
  size_t count = 0;
  Hash hasher;

  static constexpr size_t kNotFound = static_cast<size_t>(-1);

  size_t locate(const K& key) const {
    const size_t cap = slots.size();
    const size_t h = hasher(key);
    for (size_t attempt = 0; attempt < cap; ++attempt) {
      size_t idx = probe_index(h, attempt, cap);
      const Slot& slot = slots[idx];
      if (slot.state == SlotState::Empty) return kNotFound;
      if (slot.key == key) return idx;
    }
    return kNotFound;
  }

  void place(std::vector<Slot>& target, const K& key, V value) {
    const size_t cap = target.size();
    const size_t h = hasher(key);
    for (size_t attempt = 0; attempt < cap; ++attempt) {
      Slot& slot = target[probe_index(h, attempt, cap)];
      if (slot.state == SlotState::Empty) {
        slot.state = SlotState::Occupied;
        slot.key = key;
        slot.value = std::move(value);
        return;
      }
    }
    throw std::logic_error("HashTable probe sequence exhausted with " +
                           std::to_string(count) + " entries in " +
                           std::to_string(cap) + " slots");
  }

  void rehash(size_t new_capacity) {
    std::vector<Slot> fresh(new_capacity);
    for (auto& slot : slots) {
      if (slot.state == SlotState::Occupied) {
        place(fresh, slot.key, std::move(slot.value));
      }
    }
    slots.swap(fresh);
  }
};

}  // namespace chain
