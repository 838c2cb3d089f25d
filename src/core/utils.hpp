#pragma once

#include <string>
#include <vector>

// Generate a timestamp (YYYY-MM-DD HH:MM:SS) for the current local time.
std::string now_display();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Strip trailing whitespace only (secrets may legitimately start with a space).
inline void rtrim(std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) { s.clear(); return; }
    s.erase(end + 1);
}

// Split on '\n', dropping '\r'.
std::vector<std::string> split_lines(const std::string& text);

// Allow-lists for anything that ends up inside a device command line or a
// filesystem path. Host: letters, digits, '.', '-', '_', ':' (IPv6).
// Name: letters, digits, '.', '-', '_'. Path: name chars plus '/'.
bool is_safe_host(const std::string& s);
bool is_safe_name(const std::string& s);
bool is_safe_path(const std::string& s);

// Escape regex metacharacters so a literal can be embedded in a pattern.
std::string regex_escape(const std::string& literal);

// Replace every occurrence of each secret with "********".
std::string redact(const std::string& text, const std::vector<std::string>& secrets);
