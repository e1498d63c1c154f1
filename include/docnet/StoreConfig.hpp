#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace docnet {

// Settings of a store, usually read from a small JSON file:
//   { "path": "data/db.json", "indent": 2, "log_level": "info", "log_file": "docnet.log" }
// Every key is optional.
struct StoreConfig {
    std::string path = "docnet.json";  // backing snapshot file
    int indent = -1;                   // json::dump indentation, -1 = compact
    std::string log_level = "info";    // spdlog level name
    std::string log_file;              // empty -> console only

    nlohmann::json to_json() const;

    // Throws ConfigError on a wrong value type
    static StoreConfig from_json(const nlohmann::json& j);

    // Throws ConfigError if the file can't be read or parsed
    static StoreConfig from_file(const std::string& path);
};

}
