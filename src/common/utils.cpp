#include "utils.hpp"
#include "configs.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

Logger::Logger(const std::string& name_) : name(name_), fileReady(false) {
    logFilePath = FILE_LOGGING_PATH + "/" + name + ".log";
    if (ENABLE_FILE_LOGGING) {
        std::error_code ec;
        std::filesystem::create_directories(FILE_LOGGING_PATH, ec);
        if (ec) {
            std::cerr << "Failed to create directory: " << FILE_LOGGING_PATH << ": " << ec.message() << std::endl;
            return;
        }

        std::ofstream logFile(logFilePath, std::ofstream::out | std::ofstream::app);
        if (!logFile.is_open()) {
            std::cerr << "Failed to open log file: " << logFilePath << std::endl;
            return;
        }
        logFile.close();
        fileReady = true;
    }
}

void Logger::log_message(const std::string& message) {
    if (ENABLE_FILE_LOGGING && fileReady) {
        std::time_t now = std::time(nullptr);
        char timestamp[20];
        std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

        std::ofstream logFile(logFilePath, std::ofstream::out | std::ofstream::app);
        if (logFile.is_open()) {
            logFile << "[" << timestamp << "] [" << name << "] " << message << std::endl;
        } else {
            std::cerr << "Failed to open log file: " << logFilePath << std::endl;
        }
        logFile.close();
    }
}

void splitString(const std::string& input, std::vector<std::string>& splits) {
    std::istringstream ss(input);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (!token.empty()) {
            splits.push_back(token);
        }
    }
}

std::string concatString(const std::vector<std::string>& splits) {
    std::string output = "";
    for (size_t i = 0; i < splits.size(); ++i) {
        output += splits[i];
        if (i < splits.size() - 1) {
            output += ",";
        }
    }
    return output;
}

long long getCurrentTimeMillis() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

std::string byteArrayToHexString(const uint8_t* array, size_t size) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        ss << std::setw(2) << static_cast<unsigned int>(array[i]);
    }
    return ss.str();
}

bool isPrime(size_t n) {
    if (n < 2) {
        return false;
    }
    if (n % 2 == 0) {
        return n == 2;
    }
    for (size_t d = 3; d <= n / d; d += 2) {
        if (n % d == 0) {
            return false;
        }
    }
    return true;
}

size_t nextPrime(size_t n) {
    size_t candidate = n < 2 ? 2 : n;
    while (!isPrime(candidate)) {
        if (candidate == std::numeric_limits<size_t>::max()) {
            throw std::overflow_error("No prime >= " + std::to_string(n) + " fits in size_t");
        }
        candidate++;
    }
    return candidate;
}
