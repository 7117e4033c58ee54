#ifndef CONFIGS_HPP
#define CONFIGS_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "enums.hpp"

// Maglev seeds. The offset seed is also used to hash lookup keys.
extern const uint32_t MAGLEV_OFFSET_SEED;
extern const uint32_t MAGLEV_SKIP_SEED;

// Default table size is MAGLEV_CAPACITY_FACTOR slots per node, rounded up to a prime
extern const size_t MAGLEV_CAPACITY_FACTOR;

// Logging
extern bool ENABLE_FILE_LOGGING;
extern std::string FILE_LOGGING_PATH;

struct MaglevConfig {
    std::vector<std::string> nodes;
    std::optional<size_t> capacity;
    HashAlgorithm hashAlgorithm = HashAlgorithm::SIPHASH13;
    std::vector<std::string> keys;
};

// Reads {"nodes": [...], "capacity": N, "hasher": "...", "keys": [...]}
MaglevConfig loadMaglevConfig(const std::string& configFilePath);

#endif // CONFIGS_HPP
