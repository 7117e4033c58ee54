#ifndef ENUMS_H
#define ENUMS_H

#include <string>

enum HashAlgorithm {
    SIPHASH13 = 1,
    SHA1 = 2
};

HashAlgorithm parseHashAlgorithm(const std::string& name);
std::string hashAlgorithmName(HashAlgorithm algorithm);

#endif // ENUMS_H
