#pragma once

#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

// Single-line console progress bar:
//   Hashing [=========>          ] 45.0% (45/100) 2s ETA: 3s
// Redraws every 1% and at completion. A disabled bar swallows all updates.
class ProgressBar {
 public:
  ProgressBar(std::string label, size_t total, std::ostream &out = std::cout,
              bool enabled = true);

  void update(size_t current);
  void increment();
  void finish();

  size_t current() const { return current_; }
  size_t total() const { return total_; }

  static std::string format_time(long long millis);

 private:
  static constexpr int bar_width = 50;

  std::string label_;
  size_t total_;
  size_t current_ = 0;
  std::ostream &out_;
  bool enabled_;
  bool finished_ = false;
  std::chrono::steady_clock::time_point start_;

  void display();
};
