#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences; empty when stdout is not a terminal
namespace color {
    inline bool enabled() {
        static const bool tty = isatty(STDOUT_FILENO) != 0;
        return tty;
    }
    inline std::string code(const char* seq) { return enabled() ? seq : ""; }

    const std::string BLUE      = code("\033[38;2;62;120;178m");
    const std::string TEAL      = code("\033[38;2;42;157;143m");
    const std::string GRAY      = code("\033[90m");
    const std::string RED       = code("\033[91m");
    const std::string GREEN     = code("\033[92m");
    const std::string YELLOW    = code("\033[93m");
    const std::string BOLD      = code("\033[1m");
    const std::string DIM       = code("\033[2m");
    const std::string RESET     = code("\033[0m");
}

// Shorthand wrappers
inline std::string blue(const std::string& s)    { return color::BLUE + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
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
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::TEAL + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for progress events (dimmer than program output)
inline std::string log(const std::string& msg) {
    return color::GRAY + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

} // namespace theme
