#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <atomic>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <ssh/dialogue.hpp>
#include "device.hpp"

struct ControllerOptions {
    std::string label = "session";                       // prefix in the debug log
    std::chrono::milliseconds probe_timeout{DEFAULT_CONN_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds transfer_timeout{DEFAULT_READ_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds drain_quiet{DRAIN_QUIET_MS};
    std::chrono::milliseconds drain_max{DRAIN_MAX_MS};
    int enable_level = 15;                               // 0 = bare "enable"
    std::optional<std::chrono::steady_clock::time_point> run_deadline;
    const std::atomic<bool>* cancel = nullptr;
};

// Produces a connected channel (SSH in production, scripted in tests).
using ChannelOpener = std::function<Result<std::unique_ptr<SessionChannel>>()>;

// Drives one device shell through connect, elevate, probing and the
// per-unit dialogues. Every step is one or more dialogues run strictly in
// sequence; every failure is thrown as BackupError.
class SessionController {
public:
    SessionController(ControllerOptions options, std::string secret);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // ── Session setup ──
    void connect(const ChannelOpener& opener);
    void elevate();
    void disable_pager();

    // ── Probing ──
    SoftwareVersion probe_version();
    ContextMode probe_context_mode();                 // switches to "system" when multiple
    std::vector<std::string> probe_contexts();
    std::string probe_nat_override();
    bool probe_failover();

    // disable_pager + every probe, in order. Requires an elevated session.
    DeviceFacts probe();

    // ── Units ──
    // `url` is the destination directory URL without a trailing slash.
    void run_unit(const BackupUnit& unit, const std::string& url, const DeviceFacts& facts);

    void close();

    const Session& session() const { return session_; }

private:
    ControllerOptions options_;
    std::string secret_;
    Session session_;
    std::unique_ptr<DialogueEngine> engine_;

    // Runs one dialogue; throws on failure.
    DialogueOutcome run(const Dialogue& dialogue);

    Dialogue prompt_dialogue(const std::string& command,
                             std::vector<DialogueRule> rules,
                             std::chrono::milliseconds timeout) const;

    // Prefixes `command` with "failover exec standby " for the standby unit.
    static std::string on_unit(FailoverRole role, const std::string& command);

    void stage_tech_support(const std::string& file, FailoverRole role);
    void stage_backup(const std::optional<std::string>& context, const std::string& file,
                      FailoverRole role);
    void copy_to_destination(const std::string& source, const std::string& url,
                             const std::string& file, const std::string& nat_override,
                             FailoverRole role);
    void delete_from_flash(const std::string& file, FailoverRole role);
    std::string lookup_config_url(const std::string& context);

    // Copies a staged flash file out, then removes it from flash unless the
    // copy left the shell in an unknown state. A non-fatal copy error wins
    // over a non-fatal cleanup error; a fatal cleanup error is thrown.
    void copy_and_cleanup(const std::string& file, const std::string& url,
                          const std::string& nat_override, FailoverRole role);
};
