#ifndef HASH_STRATEGY_HPP
#define HASH_STRATEGY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <crypto++/sha.h>
#include <crypto++/siphash.h>

#include "enums.hpp"

// Streaming hash state. One accumulator produces one digest.
class HashAccumulator {
public:
    virtual ~HashAccumulator() = default;
    virtual void write(const uint8_t* data, size_t size) = 0;
    virtual uint64_t finish() = 0;

    // Fixed-width integers are written little-endian
    void writeU8(uint8_t value);
    void writeU32(uint32_t value);
    void writeU64(uint64_t value);
};

class HashStrategy {
public:
    virtual ~HashStrategy() = default;
    virtual std::unique_ptr<HashAccumulator> buildAccumulator() const = 0;
    virtual std::string name() const = 0;
};

class SipHasher13 : public HashAccumulator {
public:
    SipHasher13(uint64_t k0 = 0, uint64_t k1 = 0);
    void write(const uint8_t* data, size_t size) override;
    uint64_t finish() override;

private:
    CryptoPP::SipHash<1, 3, false> siphash;
};

// SipHash-1-3 keyed with zeros
class SipHashStrategy : public HashStrategy {
public:
    std::unique_ptr<HashAccumulator> buildAccumulator() const override;
    std::string name() const override;
};

class Sha1Accumulator : public HashAccumulator {
public:
    void write(const uint8_t* data, size_t size) override;
    uint64_t finish() override;

private:
    CryptoPP::SHA1 sha1;
};

// First 8 bytes of SHA-1, big-endian
class Sha1HashStrategy : public HashStrategy {
public:
    std::unique_ptr<HashAccumulator> buildAccumulator() const override;
    std::string name() const override;
};

std::shared_ptr<const HashStrategy> makeHashStrategy(HashAlgorithm algorithm);
std::shared_ptr<const HashStrategy> defaultHashStrategy();

// hashAppend overloads define what can be hashed. Provide an overload next to
// your own type to make it usable as a node or key.
inline void hashAppend(HashAccumulator& acc, std::string_view value) {
    acc.write(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    acc.writeU8(0xff);
}

inline void hashAppend(HashAccumulator& acc, const std::string& value) {
    hashAppend(acc, std::string_view(value));
}

inline void hashAppend(HashAccumulator& acc, const char* value) {
    hashAppend(acc, std::string_view(value));
}

inline void hashAppend(HashAccumulator& acc, bool value) {
    acc.writeU8(value ? 1 : 0);
}

template <typename T>
typename std::enable_if<std::is_integral<T>::value>::type hashAppend(HashAccumulator& acc, T value) {
    using U = typename std::make_unsigned<T>::type;
    U bits = static_cast<U>(value);
    uint8_t buffer[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); i++) {
        buffer[i] = static_cast<uint8_t>(bits >> (8 * i));
    }
    acc.write(buffer, sizeof(T));
}

template <typename A, typename B>
void hashAppend(HashAccumulator& acc, const std::pair<A, B>& value) {
    hashAppend(acc, value.first);
    hashAppend(acc, value.second);
}

template <typename T>
uint64_t digest(const HashStrategy& strategy, uint32_t seed, const T& value) {
    std::unique_ptr<HashAccumulator> acc = strategy.buildAccumulator();
    acc->writeU32(seed);
    hashAppend(*acc, value);
    return acc->finish();
}

#endif // HASH_STRATEGY_HPP
