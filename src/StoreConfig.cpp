#include "docnet/StoreConfig.hpp"
#include "docnet/Exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace docnet {

namespace fs = std::filesystem;
using json = nlohmann::json;

json StoreConfig::to_json() const {
    return {
        {"path", path},
        {"indent", indent},
        {"log_level", log_level},
        {"log_file", log_file}
    };
}

StoreConfig StoreConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    StoreConfig c;
    try {
        c.path = j.value("path", c.path);
        c.indent = j.value("indent", c.indent);
        c.log_level = j.value("log_level", c.log_level);
        c.log_file = j.value("log_file", c.log_file);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return c;
}

StoreConfig StoreConfig::from_file(const std::string& path) {
    if (!fs::exists(path)) {
        throw ConfigError("configuration file not found: " + path);
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open configuration file: " + path);
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }

    auto config = from_json(j);
    spdlog::debug("Store config loaded from {} (path={})", path, config.path);
    return config;
}

}
