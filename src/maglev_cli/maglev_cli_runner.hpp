#ifndef MAGLEV_CLI_RUNNER_HPP
#define MAGLEV_CLI_RUNNER_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "maglev.hpp"

struct KeyMove {
    std::string key;
    std::string before;
    std::string after;
};

struct RemovalReport {
    size_t capacity;
    std::vector<std::string> remaining;
    std::vector<KeyMove> keys;
    int moved;
};

std::string nodeOrNone(const std::string* node);

// Rebuilds without the removed nodes at the same table size and reports
// where each key went
RemovalReport reportRemoval(const Maglev<std::string>& maglev, const std::vector<std::string>& removed, const std::vector<std::string>& keys);

// Returns the process exit status
int runMaglevCli(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

#endif // MAGLEV_CLI_RUNNER_HPP
