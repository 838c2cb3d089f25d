#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Everything that can be checked without touching a firewall.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const std::vector<FirewallConfig>& firewalls);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_config_file(const fs::path& path);
std::vector<PreflightIssue> check_firewall(const FirewallConfig& fw);
