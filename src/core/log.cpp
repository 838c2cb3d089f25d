#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fmt/format.h>

static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string backup_log_path() {
    static std::string path = (platform::temp_dir() / "asabackup_debug.log").string();
    return path;
}

void backup_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(backup_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void backup_log_dialogue(const std::string& label, const std::string& cmd,
                         const std::string& status, double seconds) {
    backup_log(fmt::format("[{}] CMD: {}", label, cmd.empty() ? "<none>" : cmd));
    backup_log(fmt::format("[{}] {} {:.1f}s", label, status, seconds));
}

// ── SessionLog ───────────────────────────────────────────────

bool SessionLog::open(const std::filesystem::path& path) {
    out_.open(path, std::ios::app);
    if (!out_) return false;
    out_ << "\n===== session " << now_display() << " =====\n";
    return true;
}

void SessionLog::add_secret(const std::string& secret) {
    if (!secret.empty()) secrets_.push_back(secret);
}

SessionLog::~SessionLog() {
    flush_pending();
}

void SessionLog::received(const std::string& text) {
    if (!out_.is_open()) return;
    pending_ += text;
    auto last_nl = pending_.rfind('\n');
    if (last_nl == std::string::npos) return;
    out_ << redact(pending_.substr(0, last_nl + 1), secrets_);
    pending_.erase(0, last_nl + 1);
    out_.flush();
}

void SessionLog::flush_pending() {
    if (!out_.is_open() || pending_.empty()) return;
    out_ << redact(pending_, secrets_);
    pending_.clear();
    out_.flush();
}

void SessionLog::note(const std::string& text) {
    if (!out_.is_open()) return;
    flush_pending();
    out_ << "\n### " << redact(text, secrets_) << "\n";
    out_.flush();
}
