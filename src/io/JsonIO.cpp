#include "io/JsonIO.hpp"
#include "io/FileUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace semsearch {
namespace jsonio {

json read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open JSON file: " + path.string());

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("failed to parse JSON " + path.string() + ": " + e.what());
    }
    return j;
}

void write_json_file(const std::filesystem::path& path, const json& j, int indent) {
    const std::string text = j.dump(indent);
    write_atomic(path, [&](std::ostream& out){ out << text << "\n"; });
}

void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static const json& require_key(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_key(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require_key(j, key, where);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

std::vector<float> to_float_array(const json& arr, const std::string& where) {
    require_array(arr, where);
    std::vector<float> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_number()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a number";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<float>());
    }
    return out;
}

std::vector<float> require_float_array(const json& j, const char* key, const std::string& where) {
    return to_float_array(require_key(j, key, where), where + "." + std::string(key));
}

std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    const json& arr = require_key(j, key, where);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

}  // namespace jsonio
}  // namespace semsearch
