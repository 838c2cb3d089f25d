#pragma once

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_FILE          = "~/.asa_backup.yaml";
constexpr const char* DEFAULT_SECRET_FILE  = "~/.asa_backup.secret";
constexpr const char* SESSION_LOG_NAME     = "session.log";
constexpr const char* APP_VERSION          = "1.2.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_CONN_TIMEOUT_SECS = 30;     // connect and probing dialogues
constexpr int DEFAULT_READ_TIMEOUT_SECS = 1800;   // one wait in a backup/copy dialogue
constexpr int DEFAULT_RUN_TIMEOUT_SECS  = 7200;   // whole run per firewall
constexpr int DRAIN_QUIET_MS            = 200;    // silence that ends a drain
constexpr int DRAIN_MAX_MS              = 2000;   // hard cap on one drain
constexpr int READ_POLL_MS              = 10;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr size_t EXPECT_BUFFER_MAX       = 64 * 1024;    // matcher keeps the tail beyond this
constexpr size_t EXPECT_BUFFER_KEEP      = 8 * 1024;
constexpr size_t DIALOGUE_OUTPUT_MAX     = 1024 * 1024;

// ── Device capabilities ─────────────────────────────────────
// The native "backup" command exists from 9.3 onward.
constexpr int BACKUP_MIN_MAJOR = 9;
constexpr int BACKUP_MIN_MINOR = 3;

// Undocumented copy-command option that sources traffic from the inside
// interface, so copies leave through a site-to-site VPN tunnel.
constexpr const char* NAT_OVERRIDE_TOKEN = ";int=inside";
constexpr const char* NAT_PROBE_INTERFACE = "inside";

constexpr const char* SYSTEM_CONTEXT = "system";
constexpr const char* STANDBY_EXEC_PREFIX = "failover exec standby ";
constexpr const char* REDACTED = "********";

// ── Artifact name templates ─────────────────────────────────
// Use fmt::format with these: fmt::format(TECH_SUPPORT_FILE, suffix)
constexpr const char* TECH_SUPPORT_FILE    = "tech-support_{}.txt";
constexpr const char* BACKUP_FILE          = "backup_{}.tar.gz";
constexpr const char* CONTEXT_BACKUP_FILE  = "backup_{}_{}.tar.gz";
constexpr const char* RUNNING_CONFIG_FILE  = "running-config_{}.cfg";
constexpr const char* STARTUP_CONFIG_FILE  = "startup-config_{}.cfg";
constexpr const char* CONTEXT_CONFIG_FILE  = "context_{}_{}.cfg";
constexpr const char* STANDBY_TAG          = "standby_{}";    // wraps the suffix of standby artifacts
constexpr const char* BACKUP_URL           = "scp://{}:{}@{}/{}";
