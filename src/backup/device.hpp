#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <ssh/channel.hpp>
#include <ssh/expect.hpp>

// ── Software version ─────────────────────────────────────────

// ASA versions are dotted, not decimal: 9.12 is newer than 9.3. Minor
// segments are assumed to stay below 1000.
struct SoftwareVersion {
    int major = 0;
    int minor = 0;
    bool known = false;

    double value() const { return major + minor / 1000.0; }
    bool at_least(int maj, int min) const;
    std::string str() const;
};

bool operator<(const SoftwareVersion& a, const SoftwareVersion& b);

// ── Device facts ─────────────────────────────────────────────

enum class ContextMode {
    Single,
    Multiple,
};

std::string context_mode_name(ContextMode mode);

// Gathered once per session by the probing steps, read-only afterwards.
struct DeviceFacts {
    SoftwareVersion version;
    ContextMode mode = ContextMode::Single;
    std::vector<std::string> contexts;    // multiple mode only, "system" first
    std::string nat_override;             // "" or ";int=inside", copies only
    bool failover = false;                // a standby unit is reachable through "failover exec"

    // The native backup command; an unknown version counts as too old.
    bool supports_native_backup() const;
};

// ── Backup units ─────────────────────────────────────────────

enum class UnitKind {
    TechSupport,
    BackupArchive,
    LegacyConfig,
    ContextConfig,                        // a context's config-url file, legacy multiple mode
};

std::string unit_kind_name(UnitKind kind);

// Unit of a failover pair the commands run on. Standby commands go through
// the active unit as "failover exec standby <command>".
enum class FailoverRole {
    Active,
    Standby,
};

std::string failover_role_name(FailoverRole role);

struct BackupUnit {
    UnitKind kind;
    std::optional<std::string> context;   // archives and context configs in multiple mode
    std::string source;                   // LegacyConfig: running-config / startup-config
    std::string filename;                 // destination file name, suffix included
    FailoverRole role = FailoverRole::Active;

    std::string describe() const;
};

// ── Output parsers ───────────────────────────────────────────

// "Cisco Adaptive Security Appliance Software Version 9.16(3)23"
// No match leaves the version unknown.
SoftwareVersion parse_version(const std::string& output);

// "Security context mode: multiple"
std::optional<ContextMode> parse_context_mode(const std::string& output);

// "show context" listing: one name per line that starts with a marker
// character (' ' or '*') followed by the name. Header, summary and blank
// lines are skipped. The result starts with "system" and keeps the
// device's order for the rest.
std::vector<std::string> parse_contexts(const std::string& output);

// "Failover On" / "Failover Off" from "show failover | include ^Failover"
bool parse_failover(const std::string& output);

// "  config-url disk0:/web1.cfg" from "show run context X | include config-url".
// Empty when no line carries one.
std::string parse_config_url(const std::string& output);

// ── Session ──────────────────────────────────────────────────

// Live shell on one device. Owned by the controller for one run; the
// channel closes when the session goes away.
struct Session {
    std::unique_ptr<SessionChannel> channel;
    std::string hostname;                 // as the device prompt shows it
    std::optional<Pattern> prompt;        // anchored to the end of output
    bool elevated = false;
    std::string partition;                // "" until "changeto system"
};

// Prompt of any device: "asa1>", "asa1#", "asa1/admin(config)# ".
// Group 1 is the hostname, group 2 the privilege character.
extern const char* GENERIC_PROMPT;

// Prompt of the device whose hostname is known.
std::string prompt_pattern_for(const std::string& hostname);
