#include "device.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <regex>
#include <fmt/format.h>

const char* GENERIC_PROMPT =
    R"((?:^|[\r\n])([A-Za-z0-9_.-]+)(?:/[A-Za-z0-9_.-]+)*(?:\([A-Za-z0-9_-]+\))?([>#]) ?$)";

std::string prompt_pattern_for(const std::string& hostname) {
    return R"((?:^|[\r\n]))" + regex_escape(hostname) +
           R"((?:/[A-Za-z0-9_.-]+)*(?:\([A-Za-z0-9_-]+\))?([>#]) ?$)";
}

// ── SoftwareVersion ──────────────────────────────────────────

bool SoftwareVersion::at_least(int maj, int min) const {
    if (!known) return false;
    SoftwareVersion other{maj, min, true};
    return !(*this < other);
}

std::string SoftwareVersion::str() const {
    if (!known) return "unknown";
    return fmt::format("{}.{}", major, minor);
}

bool operator<(const SoftwareVersion& a, const SoftwareVersion& b) {
    return a.value() < b.value();
}

// ── DeviceFacts ──────────────────────────────────────────────

std::string context_mode_name(ContextMode mode) {
    return mode == ContextMode::Multiple ? "multiple" : "single";
}

bool DeviceFacts::supports_native_backup() const {
    return version.at_least(BACKUP_MIN_MAJOR, BACKUP_MIN_MINOR);
}

// ── BackupUnit ───────────────────────────────────────────────

std::string unit_kind_name(UnitKind kind) {
    switch (kind) {
    case UnitKind::TechSupport:   return "tech-support";
    case UnitKind::BackupArchive: return "backup-archive";
    case UnitKind::LegacyConfig:  return "legacy-config";
    case UnitKind::ContextConfig: return "context-config";
    }
    return "unknown";
}

std::string failover_role_name(FailoverRole role) {
    return role == FailoverRole::Standby ? "standby" : "active";
}

std::string BackupUnit::describe() const {
    std::string name = unit_kind_name(kind);
    if (role == FailoverRole::Standby) name += " on standby";
    if (context) return fmt::format("{} ({})", name, *context);
    if (!source.empty()) return fmt::format("{} ({})", name, source);
    return name;
}

// ── Parsers ──────────────────────────────────────────────────

SoftwareVersion parse_version(const std::string& output) {
    static const std::regex re(R"(Software Version (\d+)\.(\d+))");
    SoftwareVersion v;
    std::smatch m;
    if (std::regex_search(output, m, re)) {
        v.major = safe_stoi(m[1].str(), 0);
        v.minor = safe_stoi(m[2].str(), 0);
        v.known = true;
    }
    return v;
}

std::optional<ContextMode> parse_context_mode(const std::string& output) {
    static const std::regex re(R"(Security context mode: (single|multiple))");
    std::smatch m;
    if (!std::regex_search(output, m, re)) return std::nullopt;
    return m[1].str() == "multiple" ? ContextMode::Multiple : ContextMode::Single;
}

std::vector<std::string> parse_contexts(const std::string& output) {
    static const std::regex re(R"(^[ *]([A-Za-z0-9-]+))");
    std::vector<std::string> contexts{SYSTEM_CONTEXT};
    for (const auto& line : split_lines(output)) {
        std::smatch m;
        if (!std::regex_search(line, m, re)) continue;
        std::string name = m[1].str();
        if (name == SYSTEM_CONTEXT) continue;
        contexts.push_back(name);
    }
    return contexts;
}

bool parse_failover(const std::string& output) {
    static const std::regex re(R"(^Failover On)");
    for (const auto& line : split_lines(output)) {
        if (std::regex_search(line, re)) return true;
    }
    return false;
}

std::string parse_config_url(const std::string& output) {
    static const std::regex re(R"(^\s*config-url\s+(\S+))");
    for (const auto& line : split_lines(output)) {
        std::smatch m;
        if (std::regex_search(line, m, re)) return m[1].str();
    }
    return "";
}
