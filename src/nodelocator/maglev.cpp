#include "maglev.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <string>

MaglevPermutation genMaglevPermutation(uint64_t offsetHash, uint64_t skipHash, size_t m) {
    if (m < 2) {
        throw std::invalid_argument("Maglev table size must be at least 2, got " + std::to_string(m));
    }
    MaglevPermutation permutation;
    permutation.offset = offsetHash % m;
    permutation.skip = (skipHash % (m - 1)) + 1;
    return permutation;
}

std::vector<size_t> maglevPermutationSequence(const MaglevPermutation& permutation, size_t m) {
    std::vector<size_t> sequence;
    sequence.reserve(m);
    size_t c = permutation.offset;
    for (size_t k = 0; k < m; k++) {
        sequence.push_back(c);
        c = (c + permutation.skip) % m;
    }
    return sequence;
}

std::vector<size_t> populateMaglevTable(const std::vector<MaglevPermutation>& permutations, size_t m) {
    std::vector<size_t> entry;
    size_t n = permutations.size();
    if (n == 0) {
        return entry;
    }
    // A prime m makes every permutation visit all slots, so the fill terminates
    if (m < 2 || !isPrime(m)) {
        throw std::invalid_argument("Maglev table size must be a prime >= 2, got " + std::to_string(m));
    }
    for (const MaglevPermutation& permutation : permutations) {
        if (permutation.offset >= m || permutation.skip == 0 || permutation.skip >= m) {
            throw std::invalid_argument("Maglev permutation out of range for table size " + std::to_string(m));
        }
    }

    // next[i] is the next slot of node i's permutation to examine
    std::vector<size_t> next(n);
    for (size_t i = 0; i < n; i++) {
        next[i] = permutations[i].offset;
    }
    entry.assign(m, MAGLEV_UNFILLED);

    size_t filled = 0;
    while (filled < m) {
        for (size_t i = 0; i < n; i++) {
            size_t c = next[i];
            while (entry[c] != MAGLEV_UNFILLED) {
                c = (c + permutations[i].skip) % m;
            }
            entry[c] = i;
            next[i] = (c + permutations[i].skip) % m;
            filled++;

            if (filled == m) {
                break;
            }
        }
    }

    return entry;
}

size_t maglevTableSize(size_t nodeCount, std::optional<size_t> capacity) {
    if (nodeCount == 0) {
        return 0;
    }
    size_t requested = capacity.has_value() ? *capacity : nodeCount * MAGLEV_CAPACITY_FACTOR;
    return nextPrime(requested);
}

void logMaglevBuild(size_t nodeCount, size_t m, const std::string& hasherName) {
    Logger logger("maglev");
    if (nodeCount == 0) {
        logger.log_message("Built empty table (no nodes), hasher=" + hasherName);
        return;
    }
    logger.log_message("Built table with " + std::to_string(nodeCount) + " nodes, capacity=" + std::to_string(m) + ", hasher=" + hasherName);
    if (m < nodeCount) {
        logger.log_message("Capacity " + std::to_string(m) + " is smaller than the node count " + std::to_string(nodeCount) + "; some nodes own no slots");
    }
}
