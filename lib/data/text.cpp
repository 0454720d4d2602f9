#include "data/text.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

std::string load_text_data(std::string filename) {
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file) {
    throw std::runtime_error("Could not open corpus file: " + filename);
  }
  std::streamsize size = file.tellg();
  if (size <= 0) return std::string();
  file.seekg(0, std::ios::beg);
  std::string data(static_cast<size_t>(size), '\0');
  if (!file.read(&data[0], size)) {
    throw std::runtime_error("Failed to read corpus file: " + filename);
  }
  return data;
}
