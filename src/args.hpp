#pragma once
#include <string>

// Value following key on the command line, or def when key is absent.
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def = "");

// Whole string must be a positive decimal integer; throws ConfigurationError.
int parse_positive_int(const std::string& s, const std::string& flag);
