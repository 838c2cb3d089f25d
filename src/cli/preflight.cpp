#include "preflight.hpp"
#include <core/secret_store.hpp>
#include <platform/platform.hpp>
#include <system_error>
#include <sys/stat.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::vector<PreflightIssue> check_config_file(const fs::path& path) {
    std::vector<PreflightIssue> issues;

    if (!config_exists(path)) {
        issues.push_back({
            "Config not found at " + path.string(),
            "Run 'asabackup init' and edit the generated file"
        });
        return issues;
    }

    struct stat st;
    if (stat(path.c_str(), &st) == 0 && (st.st_mode & (S_IRWXG | S_IRWXO))) {
        issues.push_back({
            fmt::format("{} is readable by group/others", path.string()),
            fmt::format("chmod 600 {}", path.string()),
            true
        });
    }

    auto result = Config::load(path);
    if (result.is_err()) {
        issues.push_back({result.error, "Check YAML syntax (yamllint)"});
    }
    return issues;
}

std::vector<PreflightIssue> check_firewall(const FirewallConfig& fw) {
    std::vector<PreflightIssue> issues;

    for (const auto& problem : validate_firewall(fw)) {
        issues.push_back({
            fmt::format("Firewall '{}': {}", fw.name, problem),
            "Fix the entry (or the defaults) in the config file"
        });
    }

    auto secret_problem = check_secret_file(platform::expand_user(fw.secret_file));
    if (!secret_problem.empty()) {
        issues.push_back({
            fmt::format("Firewall '{}': {}", fw.name, secret_problem),
            "Put the secret on the first line of the file and chmod 600 it"
        });
    } else {
        auto secret = load_secret(platform::expand_user(fw.secret_file));
        std::string problem = secret.is_err() ? secret.error : check_secret_value(secret.value);
        if (!problem.empty()) {
            issues.push_back({
                fmt::format("Firewall '{}': {}", fw.name, problem),
                "Choose a secret without spaces, '@', ':', '/', '?' or '#'"
            });
        }
    }

    if (!fw.ssh_key.empty()) {
        std::error_code ec;
        if (!fs::exists(platform::expand_user(fw.ssh_key), ec)) {
            issues.push_back({
                fmt::format("Firewall '{}': ssh-key {} not found", fw.name, fw.ssh_key),
                "Fix ssh-key, or set password for password login",
                !fw.password.empty()
            });
        }
    }

    if (!fw.hostname.empty() && !platform::is_resolvable(fw.hostname)) {
        issues.push_back({
            fmt::format("Firewall '{}': host {} is not resolvable", fw.name, fw.hostname),
            "Check DNS or use the management IP address"
        });
    }

    std::error_code ec;
    if (!fw.backup_dir.empty() && !fs::is_directory(fw.backup_dir, ec)) {
        issues.push_back({
            fmt::format("Firewall '{}': backup-dir {} is not visible locally", fw.name, fw.backup_dir),
            "Fine when it only exists on the backup host; no session.log or verification then",
            true
        });
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const std::vector<FirewallConfig>& firewalls) {
    std::vector<PreflightIssue> all;
    for (const auto& fw : firewalls) {
        auto fw_issues = check_firewall(fw);
        all.insert(all.end(), fw_issues.begin(), fw_issues.end());
    }
    return all;
}
