#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <filesystem>

// Debug log: <tmp>/asabackup_debug.log, one timestamped line per call.
// Safe to call from several firewall pipelines at once.
std::string backup_log_path();
void backup_log(const std::string& msg);

// One dialogue in the debug log, e.g.
//   [asa1] CMD: show mode
//   [asa1] ok (matched 'prompt') 0.2s
void backup_log_dialogue(const std::string& label, const std::string& cmd,
                         const std::string& status, double seconds);

// Raw transcript of one device session as the device printed it (commands
// show up through the device echo), written next to the backup artifacts.
// Output is held back until a full line is available so a secret split
// across two reads is still redacted.
class SessionLog {
public:
    SessionLog() = default;
    ~SessionLog();

    bool open(const std::filesystem::path& path);
    bool is_open() const { return out_.is_open(); }

    void add_secret(const std::string& secret);
    const std::vector<std::string>& secrets() const { return secrets_; }

    void received(const std::string& text);
    void note(const std::string& text);

private:
    std::ofstream out_;
    std::vector<std::string> secrets_;
    std::string pending_;

    void flush_pending();
};
