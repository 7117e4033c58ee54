#include "enums.hpp"

#include <stdexcept>

HashAlgorithm parseHashAlgorithm(const std::string& name) {
    if (name == "siphash13" || name == "sip") {
        return HashAlgorithm::SIPHASH13;
    } else if (name == "sha1") {
        return HashAlgorithm::SHA1;
    }
    throw std::invalid_argument("Unsupported hash algorithm: " + name);
}

std::string hashAlgorithmName(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SIPHASH13:
            return "siphash13";
        case HashAlgorithm::SHA1:
            return "sha1";
    }
    return "unknown";
}
