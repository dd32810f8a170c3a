#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cstdint>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

double safe_stod(const std::string& s, double fallback) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::filesystem::path expand_user(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return std::filesystem::path(path);
}

std::string hash_id(const std::string& s) {
    std::uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return fmt::format("{:016x}", h);
}
