#pragma once

#include <string>

#include "nlohmann/json_fwd.hpp"

using json = nlohmann::json;

void dumpJson(json &j, const std::string &filename);
void dumpJson(json &j, const char *filename);

int getenv_int(const char *name, int fallback);
std::string getenv_str(const char *name, const std::string &fallback);

std::string trim(const std::string &s);
