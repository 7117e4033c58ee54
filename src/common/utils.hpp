#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class Logger {
public:
    Logger(const std::string& name);
    // I/O failures are reported on stderr and never thrown
    void log_message(const std::string& message);

private:
    std::string name;
    std::string logFilePath;
    bool fileReady;
};

void splitString(const std::string& input, std::vector<std::string>& splits);
std::string concatString(const std::vector<std::string>& splits);
long long getCurrentTimeMillis();
std::string byteArrayToHexString(const uint8_t* array, size_t size);

bool isPrime(size_t n);
// Smallest prime >= max(n, 2)
size_t nextPrime(size_t n);

#endif // UTILS_HPP
