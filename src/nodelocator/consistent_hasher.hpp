#ifndef CONSISTENT_HASHER_HPP
#define CONSISTENT_HASHER_HPP

#include <cstddef>
#include <string>
#include <vector>

// A consistent hasher remaps only about K/n of K keys when one of n nodes
// is added or removed.
template <typename N>
class ConsistentHasher {
public:
    virtual ~ConsistentHasher() = default;

    // Nodes in the order they were given
    virtual const std::vector<N>& nodes() const = 0;

    // Number of slots in the lookup table
    virtual size_t capacity() const = 0;

    // Owner of key, or nullptr when there are no nodes
    virtual const N* getNode(const std::string& key) const = 0;
};

#endif // CONSISTENT_HASHER_HPP
