#pragma once

#include <string>

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Default location of the JSON report store.
inline const char* kDefaultStorePath = "data/ohs_reports.json";
