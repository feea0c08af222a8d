#pragma once
#include "config/Config.hpp"

#include <string>

namespace semsearch {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Throw std::runtime_error when the value is present but not a number.
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// argv[index] unless it is a flag or missing
std::string positional(int argc, char** argv, int index);

// --config <path> (default semsearch.json) with --vault/--strategy/--index/--topk overrides
Config config_from_args(int argc, char** argv);

}  // namespace semsearch
