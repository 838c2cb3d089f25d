#include "utils.hpp"
#include "constants.hpp"
#include <chrono>
#include <ctime>
#include <cctype>

std::string now_display() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(line);
            line.clear();
        } else if (c != '\r') {
            line += c;
        }
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

static bool all_of_chars(const std::string& s, const char* extra) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (std::isalnum(c)) continue;
        bool allowed = false;
        for (const char* e = extra; *e; ++e) {
            if (c == static_cast<unsigned char>(*e)) { allowed = true; break; }
        }
        if (!allowed) return false;
    }
    return true;
}

bool is_safe_host(const std::string& s) {
    return all_of_chars(s, ".-_:") && s.front() != '-';
}

bool is_safe_name(const std::string& s) {
    return all_of_chars(s, ".-_") && s.front() != '-' && s != "." && s != "..";
}

bool is_safe_path(const std::string& s) {
    if (!all_of_chars(s, ".-_/")) return false;
    // No parent-directory traversal
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t slash = s.find('/', pos);
        if (slash == std::string::npos) slash = s.size();
        if (s.compare(pos, slash - pos, "..") == 0 && slash - pos == 2) return false;
        pos = slash + 1;
    }
    return true;
}

std::string regex_escape(const std::string& literal) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

std::string redact(const std::string& text, const std::vector<std::string>& secrets) {
    std::string out = text;
    for (const auto& secret : secrets) {
        if (secret.empty()) continue;
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), REDACTED);
            pos += std::string(REDACTED).size();
        }
    }
    return out;
}
