#pragma once

#include <string>
#include <atomic>
#include <ctime>
#include <optional>
#include <core/types.hpp>
#include "backup_orchestrator.hpp"
#include "verify.hpp"

struct FirewallResult {
    std::string name;
    std::string hostname;
    std::string destination;              // <backup-dir>/<name>
    bool local_destination = false;       // destination reachable on this host
    std::optional<ErrorKind> error;       // setup or probing failure
    std::string message;
    std::optional<RunReport> report;
    std::optional<VerifyReport> verify;

    bool success() const { return !error && report && report->all_ok(); }
};

// Complete pipeline for one firewall: checks, secret, destination
// directory and transcript, SSH session, orchestrated run, verification.
// Never throws BackupError; failures end up in the result.
FirewallResult backup_firewall(const FirewallConfig& fw,
                               const std::atomic<bool>* cancel = nullptr,
                               StatusCallback status = nullptr,
                               std::time_t now = std::time(nullptr));
