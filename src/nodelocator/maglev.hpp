#ifndef MAGLEV_HPP
#define MAGLEV_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "configs.hpp"
#include "consistent_hasher.hpp"
#include "hash_strategy.hpp"

// Marks a slot no node has claimed yet while the table is being populated
const size_t MAGLEV_UNFILLED = std::numeric_limits<size_t>::max();

struct MaglevPermutation {
    size_t offset;
    size_t skip;
};

// offset = offsetHash mod m, skip = (skipHash mod (m - 1)) + 1
MaglevPermutation genMaglevPermutation(uint64_t offsetHash, uint64_t skipHash, size_t m);

// The full visiting order (offset + k * skip) mod m for k = 0..m-1
std::vector<size_t> maglevPermutationSequence(const MaglevPermutation& permutation, size_t m);

// Round-robin fill: node i claims the next free slot of its permutation in
// index order until all m slots are taken. Returns slot -> node index.
std::vector<size_t> populateMaglevTable(const std::vector<MaglevPermutation>& permutations, size_t m);

// Prime table size for nodeCount nodes; 0 when there are no nodes
size_t maglevTableSize(size_t nodeCount, std::optional<size_t> capacity);

void logMaglevBuild(size_t nodeCount, size_t m, const std::string& hasherName);

template <typename N>
class Maglev : public ConsistentHasher<N> {
public:
    explicit Maglev(std::vector<N> nodes_,
                    std::optional<size_t> capacity_ = std::nullopt,
                    std::shared_ptr<const HashStrategy> hasher_ = defaultHashStrategy())
        : nodeList(std::move(nodes_)), hasher(std::move(hasher_)) {
        populate(capacity_);
    }

    template <typename InputIt>
    Maglev(InputIt first, InputIt last,
           std::optional<size_t> capacity_ = std::nullopt,
           std::shared_ptr<const HashStrategy> hasher_ = defaultHashStrategy())
        : nodeList(first, last), hasher(std::move(hasher_)) {
        populate(capacity_);
    }

    const std::vector<N>& nodes() const override {
        return nodeList;
    }

    size_t capacity() const override {
        return lookup.size();
    }

    template <typename Q>
    const N* get(const Q& key) const {
        if (lookup.empty()) {
            return nullptr;
        }
        return &nodeList[lookup[slotOf(key)]];
    }

    const N* getNode(const std::string& key) const override {
        return get(key);
    }

    // Throws std::out_of_range when the table has no nodes
    template <typename Q>
    const N& operator[](const Q& key) const {
        const N* node = get(key);
        if (node == nullptr) {
            throw std::out_of_range("Maglev lookup on a table without nodes");
        }
        return *node;
    }

    template <typename Q>
    size_t slotOf(const Q& key) const {
        if (lookup.empty()) {
            throw std::out_of_range("Maglev table without nodes has no slots");
        }
        return digest(*hasher, MAGLEV_OFFSET_SEED, key) % lookup.size();
    }

    const std::vector<size_t>& lookupTable() const {
        return lookup;
    }

    std::vector<size_t> slotCounts() const {
        std::vector<size_t> counts(nodeList.size(), 0);
        for (size_t idx : lookup) {
            counts[idx]++;
        }
        return counts;
    }

    const std::shared_ptr<const HashStrategy>& hashStrategy() const {
        return hasher;
    }

private:
    void populate(std::optional<size_t> capacity_) {
        if (!hasher) {
            throw std::invalid_argument("Maglev requires a hash strategy");
        }
        size_t m = maglevTableSize(nodeList.size(), capacity_);
        if (m == 0) {
            logMaglevBuild(0, 0, hasher->name());
            return;
        }

        std::vector<MaglevPermutation> permutations;
        permutations.reserve(nodeList.size());
        for (const N& node : nodeList) {
            permutations.push_back(genMaglevPermutation(digest(*hasher, MAGLEV_OFFSET_SEED, node),
                                                        digest(*hasher, MAGLEV_SKIP_SEED, node), m));
        }
        lookup = populateMaglevTable(permutations, m);
        logMaglevBuild(nodeList.size(), m, hasher->name());
    }

    std::vector<N> nodeList;
    std::vector<size_t> lookup;
    std::shared_ptr<const HashStrategy> hasher;
};

template <typename N>
Maglev<N> buildMaglev(std::vector<N> nodes,
                      std::optional<size_t> capacity = std::nullopt,
                      std::shared_ptr<const HashStrategy> hasher = defaultHashStrategy()) {
    return Maglev<N>(std::move(nodes), capacity, std::move(hasher));
}

#endif // MAGLEV_HPP
