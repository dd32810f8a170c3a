#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string AMBER     = "\033[38;2;255;190;0m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::AMBER + color::BOLD + "  wosh" + color::RESET
         + color::DIM + "  offline run syncer v" + WOSH_VERSION
         + color::RESET + "\n";
}

// Section header — blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Usage row: command, argument placeholder, description
inline std::string usage_row(const std::string& cmd, const std::string& arg, const std::string& desc) {
    return color::BLUE + fmt::format("    {:<14}", cmd) + color::RESET
         + color::AMBER + fmt::format("{:<12}", arg) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
