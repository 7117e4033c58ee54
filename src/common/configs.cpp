#include "configs.hpp"
#include "enums.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <jsoncpp/json/json.h>

const uint32_t MAGLEV_OFFSET_SEED = 0xdeadbabe;
const uint32_t MAGLEV_SKIP_SEED = 0xdeadbeef;

const size_t MAGLEV_CAPACITY_FACTOR = 100;

bool ENABLE_FILE_LOGGING = false;
std::string FILE_LOGGING_PATH = "/tmp/maglev";

static void readStringArray(const Json::Value& value, const std::string& field, const std::string& configFilePath, std::vector<std::string>& out) {
    if (!value.isArray()) {
        throw std::runtime_error("Invalid config " + configFilePath + ": '" + field + "' must be an array");
    }
    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
        if (!value[i].isString()) {
            throw std::runtime_error("Invalid config " + configFilePath + ": '" + field + "' entry " + std::to_string(i) + " is not a string");
        }
        out.push_back(value[i].asString());
    }
}

MaglevConfig loadMaglevConfig(const std::string& configFilePath) {
    std::ifstream configFile(configFilePath);
    if (!configFile.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFilePath);
    }

    Json::Value root;
    Json::CharReaderBuilder readerBuilder;
    std::string errors;
    if (!Json::parseFromStream(readerBuilder, configFile, &root, &errors)) {
        throw std::runtime_error("Failed to parse config file " + configFilePath + ": " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Invalid config " + configFilePath + ": top level must be an object");
    }
    if (!root.isMember("nodes")) {
        throw std::runtime_error("Invalid config " + configFilePath + ": missing 'nodes'");
    }

    MaglevConfig config;
    readStringArray(root["nodes"], "nodes", configFilePath, config.nodes);

    if (root.isMember("capacity")) {
        const Json::Value& capacity = root["capacity"];
        if (!capacity.isIntegral() || (capacity.isInt64() && capacity.asInt64() < 0)) {
            throw std::runtime_error("Invalid config " + configFilePath + ": 'capacity' must be a non-negative integer");
        }
        config.capacity = static_cast<size_t>(capacity.asUInt64());
    }

    if (root.isMember("hasher")) {
        if (!root["hasher"].isString()) {
            throw std::runtime_error("Invalid config " + configFilePath + ": 'hasher' must be a string");
        }
        try {
            config.hashAlgorithm = parseHashAlgorithm(root["hasher"].asString());
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Invalid config " + configFilePath + ": " + e.what());
        }
    }

    if (root.isMember("keys")) {
        readStringArray(root["keys"], "keys", configFilePath, config.keys);
    }

    return config;
}
