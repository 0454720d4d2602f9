#include "progress.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

ProgressBar::ProgressBar(std::string label, size_t total, std::ostream &out,
                         bool enabled)
    : label_(std::move(label)),
      total_(total),
      out_(out),
      enabled_(enabled),
      start_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(size_t current) {
  current_ = current;
  display();
}

void ProgressBar::increment() {
  ++current_;
  size_t step = std::max<size_t>(1, total_ / 100);
  if (current_ % step == 0 || current_ == total_) display();
}

void ProgressBar::finish() {
  current_ = total_;
  display();
}

std::string ProgressBar::format_time(long long millis) {
  long long seconds = millis / 1000;
  long long minutes = seconds / 60;
  long long hours = minutes / 60;
  std::ostringstream ss;
  if (hours > 0) {
    ss << hours << "h " << minutes % 60 << "m " << seconds % 60 << "s";
  } else if (minutes > 0) {
    ss << minutes << "m " << seconds % 60 << "s";
  } else {
    ss << seconds << "s";
  }
  return ss.str();
}

void ProgressBar::display() {
  if (!enabled_ || finished_) return;
  double percentage =
      total_ > 0 ? static_cast<double>(current_) / total_ * 100.0 : 0.0;
  size_t filled = total_ > 0 ? bar_width * current_ / total_ : 0;

  using millis = std::chrono::milliseconds;
  auto elapsed = std::chrono::duration_cast<millis>(
                     std::chrono::steady_clock::now() - start_)
                     .count();
  long long eta = current_ > 0 && current_ < total_
                      ? elapsed * static_cast<long long>(total_ - current_) /
                            static_cast<long long>(current_)
                      : 0;

  std::ostringstream bar;
  bar << '\r' << label_ << " [";
  for (size_t i = 0; i < static_cast<size_t>(bar_width); ++i) {
    if (i < filled) {
      bar << '=';
    } else if (i == filled) {
      bar << '>';
    } else {
      bar << ' ';
    }
  }
  bar << "] " << std::fixed << std::setprecision(1) << percentage << "% ("
      << current_ << "/" << total_ << ") " << format_time(elapsed);
  if (current_ < total_) {
    bar << " ETA: " << format_time(eta);
  } else {
    bar << " Done!";
  }

  out_ << bar.str();
  if (current_ >= total_) {
    out_ << std::endl;
    finished_ = true;
  } else {
    out_.flush();
  }
}
