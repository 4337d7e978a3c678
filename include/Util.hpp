#pragma once

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace util {

inline std::string readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

inline bool fileExists(const std::string& path) {
    std::ifstream f(path.c_str());
    return (bool)f;
}

inline void logInfo(const std::string& msg) {
    std::cout << "[INFO] " << msg << std::endl;
}

inline void logWarn(const std::string& msg) {
    std::cout << "[WARN] " << msg << std::endl;
}

inline void logError(const std::string& msg) {
    std::cerr << "[ERROR] " << msg << std::endl;
}

inline float clampf(float v, float lo, float hi) {
    return std::max(lo, std::min(hi, v));
}

// First path in the list that exists on disk, or empty.
template <typename Paths>
std::string firstExisting(const Paths& paths) {
    for (const auto& p : paths) {
        if (fileExists(p)) return p;
    }
    return {};
}

} // namespace util
