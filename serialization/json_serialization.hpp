#ifndef BREPCORE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define BREPCORE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <index/tolerance.hpp>
#include <serialization/config_json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace brep::json {

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);  // Pretty print with 2-space indent
}

// Read JSON from file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

// Tolerances from the "tolerance" object of a config file. Absent object
// or keys keep their defaults.
inline ToleranceConfig load_tolerance_config(const std::string& path) {
    nlohmann::json config = read_json_file(path);
    if (config.contains("tolerance")) {
        return config["tolerance"].get<ToleranceConfig>();
    }
    return ToleranceConfig{};
}

}  // namespace brep::json

#endif // BREPCORE_SERIALIZATION_JSON_SERIALIZATION_HPP
