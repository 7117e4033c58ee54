#include "hash_strategy.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <string>

void HashAccumulator::writeU8(uint8_t value) {
    write(&value, 1);
}

void HashAccumulator::writeU32(uint32_t value) {
    uint8_t buffer[4];
    for (int i = 0; i < 4; i++) {
        buffer[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    write(buffer, sizeof(buffer));
}

void HashAccumulator::writeU64(uint64_t value) {
    uint8_t buffer[8];
    for (int i = 0; i < 8; i++) {
        buffer[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    write(buffer, sizeof(buffer));
}

SipHasher13::SipHasher13(uint64_t k0, uint64_t k1) {
    // 128-bit key: k0 then k1, both little-endian
    CryptoPP::byte key[16];
    for (int i = 0; i < 8; i++) {
        key[i] = static_cast<CryptoPP::byte>(k0 >> (8 * i));
        key[8 + i] = static_cast<CryptoPP::byte>(k1 >> (8 * i));
    }
    siphash.SetKey(key, sizeof(key));
}

void SipHasher13::write(const uint8_t* data, size_t size) {
    siphash.Update(reinterpret_cast<const CryptoPP::byte*>(data), size);
}

uint64_t SipHasher13::finish() {
    CryptoPP::byte tag[8];
    siphash.Final(tag);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value |= static_cast<uint64_t>(tag[i]) << (8 * i);
    }
    return value;
}

std::unique_ptr<HashAccumulator> SipHashStrategy::buildAccumulator() const {
    return std::make_unique<SipHasher13>();
}

std::string SipHashStrategy::name() const {
    return hashAlgorithmName(HashAlgorithm::SIPHASH13);
}

void Sha1Accumulator::write(const uint8_t* data, size_t size) {
    sha1.Update(reinterpret_cast<const CryptoPP::byte*>(data), size);
}

uint64_t Sha1Accumulator::finish() {
    uint8_t digested[CryptoPP::SHA1::DIGESTSIZE];
    sha1.Final(reinterpret_cast<CryptoPP::byte*>(digested));
    std::string hex = byteArrayToHexString(digested, sizeof(uint64_t));
    return std::stoull(hex, nullptr, 16);
}

std::unique_ptr<HashAccumulator> Sha1HashStrategy::buildAccumulator() const {
    return std::make_unique<Sha1Accumulator>();
}

std::string Sha1HashStrategy::name() const {
    return hashAlgorithmName(HashAlgorithm::SHA1);
}

std::shared_ptr<const HashStrategy> makeHashStrategy(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SIPHASH13:
            return std::make_shared<SipHashStrategy>();
        case HashAlgorithm::SHA1:
            return std::make_shared<Sha1HashStrategy>();
    }
    throw std::invalid_argument("Unsupported hash algorithm: " + std::to_string(static_cast<int>(algorithm)));
}

std::shared_ptr<const HashStrategy> defaultHashStrategy() {
    static const std::shared_ptr<const HashStrategy> strategy = std::make_shared<SipHashStrategy>();
    return strategy;
}
