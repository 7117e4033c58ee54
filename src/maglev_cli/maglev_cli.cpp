#include <iostream>

#include "maglev_cli_runner.hpp"

int main(int argc, char** argv) {
    return runMaglevCli(argc, argv, std::cout, std::cerr);
}
