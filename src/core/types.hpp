#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <stdexcept>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Error taxonomy ──────────────────────────────────────────

enum class ErrorKind {
    Configuration,          // missing secret file, invalid destination
    Connection,             // unreachable host, unexpected disconnect
    Authentication,         // bad password, access denied
    Timeout,                // no rule matched within the bound
    UnsupportedOperation,   // device rejected the command as invalid input
    UnrecognizedOutput,     // output matched none of the declared rules
    CommandFailed,          // device reported an explicit %Error line
    Cancelled,              // run deadline hit or operator interrupt
};

// "ConfigurationError", "TimeoutError", ...
std::string error_kind_name(ErrorKind kind);

// Fatal-for-the-session kinds leave the shell in an unknown state.
bool is_session_fatal(ErrorKind kind);

class BackupError : public std::runtime_error {
public:
    BackupError(ErrorKind kind, const std::string& message,
                const std::string& command = "");

    ErrorKind kind() const { return kind_; }
    const std::string& command() const { return command_; }

private:
    ErrorKind kind_;
    std::string command_;
};

// ── Configuration structures ────────────────────────────────

struct FirewallConfig {
    std::string name;                 // inventory key, e.g. "asa1"
    std::string hostname;
    int port = 22;
    std::string username;
    std::string ssh_key;              // private key path (~ expanded)
    std::string password;             // optional SSH login password
    std::string secret_file;          // enable / scp / passphrase secret
    int enable_level = 15;            // 0 = bare "enable"
    std::string backup_host;
    std::string backup_username;
    std::string backup_dir;
    int conn_timeout = 30;            // seconds
    int read_timeout = 1800;          // seconds
    int run_timeout = 7200;           // seconds, 0 = no run deadline
    bool verify = true;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
