#pragma once

#include <string>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Safe floating point parse, same contract as safe_stoi.
double safe_stod(const std::string& s, double fallback = 0);

// Expand a leading "~" to the home directory.
std::filesystem::path expand_user(const std::string& path);

// Stable hex digest of a string (FNV-1a, 64 bit). Used to name command files
// so that repeated triggers for one directory collapse onto one file.
std::string hash_id(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
