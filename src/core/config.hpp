#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// ~/.asa_backup.yaml:
//   defaults:   keys merged into every firewall entry that lacks them
//   parallel:   firewalls processed concurrently
//   firewalls:  name -> entry
class Config {
public:
    static Result<Config> load(const fs::path& path);
    static Result<Config> parse(const std::string& yaml_text);

    const std::vector<FirewallConfig>& firewalls() const { return firewalls_; }
    const FirewallConfig* find(const std::string& name) const;
    int parallel() const { return parallel_; }
    const fs::path& path() const { return path_; }

    Config() = default;

private:
    std::vector<FirewallConfig> firewalls_;   // sorted by name
    int parallel_ = 1;
    fs::path path_;
};

fs::path get_config_path();
bool config_exists(const fs::path& path);

// Writes a commented default file with mode 0600. An existing file is left
// alone.
Result<void> create_default_config(const fs::path& path);

// No names or "all" selects every firewall. Otherwise every name must be
// configured; the result is de-duplicated and in configuration order.
Result<std::vector<FirewallConfig>> select_firewalls(const Config& cfg,
                                                     const std::vector<std::string>& names);

// Problems that make an entry unusable: missing keys, names outside the
// allow-lists. Empty = OK.
std::vector<std::string> validate_firewall(const FirewallConfig& fw);
