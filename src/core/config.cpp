#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <sys/stat.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

static const std::set<std::string> FIREWALL_KEYS = {
    "hostname", "port", "username", "ssh-key", "password", "secret-file",
    "enable-level", "backup-host", "backup-username", "backup-dir",
    "conn-timeout", "read-timeout", "run-timeout", "verify",
};

fs::path get_config_path() {
    return platform::expand_user(CONFIG_FILE);
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# Cisco ASA backup configuration
# Check syntax with yamllint after editing. The file holds no secrets; the
# enable / scp / backup passphrase secret lives in the secret-file (mode 0600).

defaults:
  username: backup
  ssh-key: ~/.ssh/id_rsa
  secret-file: ~/.asa_backup.secret
  enable-level: 15
  backup-host: 10.0.0.10
  backup-username: backup
  backup-dir: /mnt/backup/cisco/asa
  conn-timeout: 30
  read-timeout: 1800
  run-timeout: 7200
  verify: true

parallel: 1

firewalls:
  asa1:
    hostname: asa1.example.com
#  asa2:
#    hostname: asa2.example.com
#    enable-level: 0
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        if (chmod(path.c_str(), 0600) != 0) {
            return Result<void>::Err("Failed to set mode 0600 on " + path.string());
        }
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// ── Parsing ──────────────────────────────────────────────────

static FirewallConfig parse_firewall(const std::string& name, const YAML::Node& node) {
    FirewallConfig fw;
    fw.name = name;
    fw.hostname = node["hostname"].as<std::string>("");
    fw.port = node["port"].as<int>(22);
    fw.username = node["username"].as<std::string>("");
    fw.ssh_key = node["ssh-key"].as<std::string>("");
    fw.password = node["password"].as<std::string>("");
    fw.secret_file = node["secret-file"].as<std::string>(DEFAULT_SECRET_FILE);
    fw.enable_level = node["enable-level"].as<int>(15);
    fw.backup_host = node["backup-host"].as<std::string>("");
    fw.backup_username = node["backup-username"].as<std::string>("");
    fw.backup_dir = node["backup-dir"].as<std::string>("");
    fw.conn_timeout = node["conn-timeout"].as<int>(DEFAULT_CONN_TIMEOUT_SECS);
    fw.read_timeout = node["read-timeout"].as<int>(DEFAULT_READ_TIMEOUT_SECS);
    fw.run_timeout = node["run-timeout"].as<int>(DEFAULT_RUN_TIMEOUT_SECS);
    fw.verify = node["verify"].as<bool>(true);
    return fw;
}

// Copies every defaults key the entry does not set itself.
static YAML::Node merge_defaults(const YAML::Node& entry, const YAML::Node& defaults) {
    YAML::Node merged = YAML::Clone(entry);
    if (!defaults || !defaults.IsMap()) return merged;
    for (const auto& kv : defaults) {
        std::string key = kv.first.as<std::string>();
        if (!merged[key]) merged[key] = YAML::Clone(kv.second);
    }
    return merged;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        Config config;
        config.parallel_ = std::max(1, root["parallel"].as<int>(1));

        YAML::Node defaults = root["defaults"];
        if (defaults && !defaults.IsMap()) {
            return Result<Config>::Err("'defaults' must be a mapping");
        }
        if (defaults) {
            for (const auto& kv : defaults) {
                std::string key = kv.first.as<std::string>();
                if (!FIREWALL_KEYS.count(key)) {
                    return Result<Config>::Err(fmt::format("Unknown key '{}' in defaults", key));
                }
            }
        }

        YAML::Node firewalls = root["firewalls"];
        if (!firewalls || !firewalls.IsMap() || firewalls.size() == 0) {
            return Result<Config>::Err("No firewalls configured");
        }

        for (const auto& kv : firewalls) {
            std::string name = kv.first.as<std::string>();
            YAML::Node entry = kv.second.IsNull() ? YAML::Node(YAML::NodeType::Map) : kv.second;
            if (!entry.IsMap()) {
                return Result<Config>::Err(fmt::format("Firewall '{}' must be a mapping", name));
            }
            for (const auto& field : entry) {
                std::string key = field.first.as<std::string>();
                if (!FIREWALL_KEYS.count(key)) {
                    return Result<Config>::Err(fmt::format("Unknown key '{}' in firewall '{}'", key, name));
                }
            }
            config.firewalls_.push_back(parse_firewall(name, merge_defaults(entry, defaults)));
        }

        std::sort(config.firewalls_.begin(), config.firewalls_.end(),
                  [](const FirewallConfig& a, const FirewallConfig& b) { return a.name < b.name; });
        return Result<Config>::Ok(std::move(config));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not readable at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_ok()) result.value.path_ = path;
    return result;
}

const FirewallConfig* Config::find(const std::string& name) const {
    for (const auto& fw : firewalls_) {
        if (fw.name == name) return &fw;
    }
    return nullptr;
}

// ── Selection and validation ─────────────────────────────────

Result<std::vector<FirewallConfig>> select_firewalls(const Config& cfg,
                                                     const std::vector<std::string>& names) {
    bool all = names.empty() ||
               std::find(names.begin(), names.end(), "all") != names.end();
    if (all) {
        return Result<std::vector<FirewallConfig>>::Ok(cfg.firewalls());
    }

    std::vector<std::string> unknown;
    for (const auto& n : names) {
        if (!cfg.find(n) && std::find(unknown.begin(), unknown.end(), n) == unknown.end()) {
            unknown.push_back(n);
        }
    }
    if (!unknown.empty()) {
        std::string list;
        for (const auto& n : unknown) list += (list.empty() ? "" : ", ") + n;
        return Result<std::vector<FirewallConfig>>::Err("Unknown firewall(s): " + list);
    }

    std::set<std::string> wanted(names.begin(), names.end());
    std::vector<FirewallConfig> selected;
    for (const auto& fw : cfg.firewalls()) {
        if (wanted.count(fw.name)) selected.push_back(fw);
    }
    return Result<std::vector<FirewallConfig>>::Ok(selected);
}

std::vector<std::string> validate_firewall(const FirewallConfig& fw) {
    std::vector<std::string> problems;

    if (!is_safe_name(fw.name)) {
        problems.push_back(fmt::format("Firewall name '{}' contains characters outside [A-Za-z0-9._-]", fw.name));
    }

    auto check_host = [&](const std::string& key, const std::string& value) {
        if (value.empty()) {
            problems.push_back(fmt::format("{} is not set", key));
        } else if (!is_safe_host(value)) {
            problems.push_back(fmt::format("{} '{}' contains characters outside [A-Za-z0-9.:_-]", key, value));
        }
    };
    check_host("hostname", fw.hostname);
    check_host("backup-host", fw.backup_host);

    if (fw.username.empty()) {
        problems.push_back("username is not set");
    }
    if (fw.backup_username.empty()) {
        problems.push_back("backup-username is not set");
    } else if (!is_safe_name(fw.backup_username)) {
        problems.push_back(fmt::format("backup-username '{}' contains characters outside [A-Za-z0-9._-]",
                                       fw.backup_username));
    }

    if (fw.backup_dir.empty()) {
        problems.push_back("backup-dir is not set");
    } else if (!is_safe_path(fw.backup_dir)) {
        problems.push_back(fmt::format("backup-dir '{}' contains characters outside [A-Za-z0-9._/-] or '..'",
                                       fw.backup_dir));
    }

    if (fw.ssh_key.empty() && fw.password.empty()) {
        problems.push_back("neither ssh-key nor password is set");
    }
    if (fw.port <= 0 || fw.port > 65535) {
        problems.push_back(fmt::format("port {} is out of range", fw.port));
    }
    if (fw.enable_level < 0 || fw.enable_level > 15) {
        problems.push_back(fmt::format("enable-level {} is out of range 0-15", fw.enable_level));
    }
    if (fw.conn_timeout <= 0 || fw.read_timeout <= 0 || fw.run_timeout < 0) {
        problems.push_back("timeouts must be positive (run-timeout 0 disables the run deadline)");
    }
    return problems;
}
