#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SshTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;                     // optional, fallback after the key
    std::optional<std::string> ssh_key_path;
    int timeout = 30;                         // seconds, connect + handshake + auth
    std::string known_hosts;                  // OpenSSH known_hosts file
};

// Interactive shell over libssh2: PTY, shell request, non-blocking reads.
// First-contact host keys are accepted and written to known_hosts (no
// operator is around to answer); a changed key is refused.
class SshChannel : public SessionChannel {
public:
    explicit SshChannel(const SshTarget& target);
    ~SshChannel() override;

    // Call once per process before any channel is created.
    static Result<void> global_init();
    static void global_shutdown();

    Result<void> establish(StatusCallback callback = nullptr);

    Result<void> send(const std::string& text) override;
    void close() override;
    bool is_open() const override { return channel_ != nullptr; }

    SshChannel(const SshChannel&) = delete;
    SshChannel& operator=(const SshChannel&) = delete;

protected:
    ReadChunk read_some(std::chrono::milliseconds wait) override;

private:
    SshTarget target_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;

    Result<void> verify_host_key(StatusCallback callback);
    Result<void> userauth(StatusCallback callback);
    Result<void> open_shell();
    // Blocks until the socket is ready in the direction libssh2 is waiting on.
    void wait_socket(int timeout_ms);
};
