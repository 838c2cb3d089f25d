#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <filesystem>
#include <core/config.hpp>
#include <backup/firewall_backup.hpp>

// Exit codes
constexpr int EXIT_ALL_OK      = 0;
constexpr int EXIT_SOME_FAILED = 1;
constexpr int EXIT_USAGE       = 2;

struct CliOptions {
    fs::path config_path;
    int jobs = 0;                          // 0 = "parallel" from the config
    std::vector<std::string> firewalls;    // empty or "all" = every firewall
};

class BackupCLI {
public:
    explicit BackupCLI(const std::atomic<bool>* cancel = nullptr);

    int run_backup(const CliOptions& opts);
    int run_check(const CliOptions& opts);
    int run_init(const fs::path& config_path);

private:
    const std::atomic<bool>* cancel_;
    std::mutex console_mutex_;

    // Loads the config and resolves the selection; prints and returns
    // false on failure.
    bool load_selection(const CliOptions& opts, Config& cfg, std::vector<FirewallConfig>& selected);

    void print_line(const std::string& text);
    void print_result(const FirewallResult& result);
};
