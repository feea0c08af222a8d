#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace semsearch {
namespace jsonio {

using json = nlohmann::json;

// Throws std::runtime_error when the file is missing or not valid JSON.
json read_json_file(const std::filesystem::path& path);

// Serializes with dump(indent) and replaces the file atomically.
void write_json_file(const std::filesystem::path& path, const json& j, int indent = -1);

// Schema checks. Each throws std::runtime_error naming `where` and the key.
void require_object(const json& j, const std::string& where);
void require_array(const json& j, const std::string& where);
std::string require_string(const json& j, const char* key, const std::string& where);
double require_number(const json& j, const char* key, const std::string& where);
std::vector<float> require_float_array(const json& j, const char* key, const std::string& where);
std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where);

std::vector<float> to_float_array(const json& arr, const std::string& where);

}  // namespace jsonio
}  // namespace semsearch
