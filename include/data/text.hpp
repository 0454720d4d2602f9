#pragma once

#include <string>

// Reads a whole file into memory. Throws std::runtime_error if it cannot be
// opened.
std::string load_text_data(std::string filename);
