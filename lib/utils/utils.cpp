#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "nlohmann/json.hpp"

void dumpJson(json &j, const std::string &filename) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    std::cerr << "Could not open file for writing: " << filename << std::endl;
    throw std::runtime_error("FILE_NOT_FOUND");
  }
  file << j.dump(4) << std::endl;
}

void dumpJson(json &j, const char *filename) {
  dumpJson(j, std::string(filename));
}

int getenv_int(const char *name, int fallback) {
  if (!name) return fallback;
  if (const char *value = std::getenv(name)) {
    char *end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end != value) return static_cast<int>(parsed);
  }
  return fallback;
}

std::string getenv_str(const char *name, const std::string &fallback) {
  if (!name) return fallback;
  if (const char *value = std::getenv(name)) {
    if (value[0] != '\0') return std::string(value);
  }
  return fallback;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return std::string();
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}
