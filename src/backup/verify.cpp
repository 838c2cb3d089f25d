#include "verify.hpp"
#include <core/utils.hpp>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::optional<std::string> find_cryptochecksum(const std::string& config_text) {
    static const std::regex re(R"(^Cryptochecksum:([0-9a-f]+)$)");
    std::optional<std::string> checksum;
    for (auto line : split_lines(config_text)) {
        trim(line);
        std::smatch m;
        if (std::regex_match(line, m, re)) checksum = m[1].str();
    }
    return checksum;
}

static std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Succeeded unit of that kind and role whose source (legacy configs) or
// context (context configs) is `key`.
static const BackupUnit* find_ok(const RunReport& report, UnitKind kind, FailoverRole role,
                                 const std::string& key) {
    for (const auto& outcome : report.units) {
        const BackupUnit& unit = outcome.unit;
        if (outcome.status != UnitStatus::Ok || unit.kind != kind || unit.role != role) continue;
        if ((kind == UnitKind::LegacyConfig ? unit.source : unit.context.value_or("")) == key) {
            return &unit;
        }
    }
    return nullptr;
}

// Unreadable files were already flagged as missing.
static void compare_checksums(const fs::path& dir, const std::string& first,
                              const std::string& second, const std::string& hint,
                              VerifyReport& result) {
    auto first_text = read_file(dir / first);
    auto second_text = read_file(dir / second);
    if (!first_text || !second_text) return;

    auto a = find_cryptochecksum(*first_text);
    auto b = find_cryptochecksum(*second_text);
    if (a != b) {
        result.warnings.push_back(fmt::format("{} and {} differ (Cryptochecksum {} vs {}); {}",
                                              first, second, a.value_or("none"),
                                              b.value_or("none"), hint));
    }
}

VerifyReport verify_destination(const fs::path& dir, const RunReport& report) {
    VerifyReport result;

    for (const auto& outcome : report.units) {
        if (outcome.status != UnitStatus::Ok) continue;

        ArtifactCheck check;
        check.filename = outcome.unit.filename;
        std::error_code ec;
        fs::path file = dir / check.filename;
        check.exists = fs::is_regular_file(file, ec);
        if (check.exists) {
            check.size = fs::file_size(file, ec);
            if (ec) check.size = 0;
        }

        if (!check.exists) {
            result.warnings.push_back(fmt::format("{} is missing", check.filename));
        } else if (check.size == 0) {
            result.warnings.push_back(fmt::format("{} is empty", check.filename));
        }
        result.artifacts.push_back(check);
    }

    for (auto role : {FailoverRole::Active, FailoverRole::Standby}) {
        const auto* running = find_ok(report, UnitKind::LegacyConfig, role, "running-config");
        const auto* startup = find_ok(report, UnitKind::LegacyConfig, role, "startup-config");
        if (!running || !startup) continue;
        compare_checksums(dir, running->filename, startup->filename,
                          "'write memory' was probably forgotten", result);
    }

    for (const auto& outcome : report.units) {
        const BackupUnit& unit = outcome.unit;
        if (unit.kind != UnitKind::ContextConfig || unit.role != FailoverRole::Active) continue;
        if (outcome.status != UnitStatus::Ok) continue;
        const auto* standby = find_ok(report, UnitKind::ContextConfig, FailoverRole::Standby,
                                      unit.context.value_or(""));
        if (!standby) continue;
        compare_checksums(dir, unit.filename, standby->filename,
                          "failover replication is out of sync", result);
    }
    return result;
}
