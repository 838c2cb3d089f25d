#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string TEAL      = "\033[38;2;0;133;119m";
    const std::string SLATE     = "\033[38;2;96;112;128m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 60; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title + version, no screen clearing (output usually goes to cron mail)
inline std::string banner(const std::string& version) {
    return "\n" + color::TEAL + color::BOLD + "  ASA configuration backup\n"
        + color::RESET + color::DIM + "  v" + version
        + color::RESET + "\n\n"
        + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::SLATE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SLATE + "    > " + color::RESET + msg + "\n";
}

// Key-value row, e.g. the per-firewall header
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<18}", key) + color::RESET + value + "\n";
}

} // namespace theme
