#include "ssh_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fmt/format.h>

using namespace std::chrono;

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: every prompt gets the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = data->password.length();
    }
    data->prompt_round++;
}

static int knownhost_key_type(int hostkey_type) {
    switch (hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default: return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

static std::string hex_fingerprint(const char* hash, size_t len) {
    std::string out;
    for (size_t i = 0; i < len; ++i) {
        if (i) out += ':';
        out += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
    }
    return out;
}

// ── SshChannel ───────────────────────────────────────────────

Result<void> SshChannel::global_init() {
    if (libssh2_init(0) != 0) {
        return Result<void>::Err("Failed to initialize libssh2");
    }
    return Result<void>::Ok();
}

void SshChannel::global_shutdown() {
    libssh2_exit();
}

SshChannel::SshChannel(const SshTarget& target)
    : target_(target), session_(nullptr), channel_(nullptr),
      sock_(ASABACKUP_INVALID_SOCKET) {
}

SshChannel::~SshChannel() {
    close();
}

void SshChannel::wait_socket(int timeout_ms) {
    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock_, events, timeout_ms);
}

Result<void> SshChannel::establish(StatusCallback callback) {
    if (callback) callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error);
    }
    sock_ = sock.value;
    platform::enable_keepalive(sock_);

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    auto deadline = steady_clock::now() + seconds(target_.timeout);
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (steady_clock::now() >= deadline) break;
        wait_socket(100);
    }
    if (ret != 0) {
        close();
        return Result<void>::Err(fmt::format("SSH handshake with {} failed ({})", target_.host, ret));
    }

    libssh2_keepalive_config(session_, 1, 30);

    auto host_ok = verify_host_key(callback);
    if (host_ok.is_err()) {
        close();
        return host_ok;
    }

    if (callback) callback("SSH handshake complete, authenticating...");
    auto auth = userauth(callback);
    if (auth.is_err()) {
        close();
        return auth;
    }

    auto shell = open_shell();
    if (shell.is_err()) {
        close();
        return shell;
    }

    backup_log(fmt::format("[{}] shell channel open as {}", target_.host, target_.user));
    return Result<void>::Ok();
}

Result<void> SshChannel::verify_host_key(StatusCallback callback) {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err("Server sent no host key");
    }

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session_);
    if (!hosts) {
        return Result<void>::Err("Failed to initialize known hosts");
    }

    // A missing file is fine: the first contact creates it.
    libssh2_knownhost_readfile(hosts, target_.known_hosts.c_str(),
                               LIBSSH2_KNOWNHOST_FILE_OPENSSH);

    int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW;
    struct libssh2_knownhost* found = nullptr;
    int check = libssh2_knownhost_checkp(hosts, target_.host.c_str(), target_.port,
                                         key, key_len, typemask, &found);

    const char* sha1 = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1);
    std::string fingerprint = sha1 ? hex_fingerprint(sha1, 20) : "?";

    Result<void> result = Result<void>::Ok();
    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        break;

    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        result = Result<void>::Err(fmt::format(
            "Host key for {} has changed (SHA1 {}); refusing to connect", target_.host, fingerprint));
        break;

    default: {
        std::string entry = (target_.port == 22)
            ? target_.host
            : fmt::format("[{}]:{}", target_.host, target_.port);
        int added = libssh2_knownhost_addc(hosts, entry.c_str(), nullptr, key, key_len,
                                           nullptr, 0, typemask | knownhost_key_type(key_type),
                                           nullptr);
        if (added != 0 ||
            libssh2_knownhost_writefile(hosts, target_.known_hosts.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            backup_log(fmt::format("[{}] could not write {}", target_.host, target_.known_hosts));
        }
        if (callback) callback(fmt::format("Accepted new host key {}", fingerprint));
        backup_log(fmt::format("[{}] accepted new host key SHA1 {}", target_.host, fingerprint));
        break;
    }
    }

    libssh2_knownhost_free(hosts);
    return result;
}

Result<void> SshChannel::userauth(StatusCallback callback) {
    auto deadline = steady_clock::now() + seconds(target_.timeout);
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              target_.user.length())) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (steady_clock::now() >= deadline) break;
        wait_socket(100);
    }
    std::string methods = auth_list ? auth_list : "";

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        auto key = platform::expand_user(*target_.ssh_key_path).string();
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                                                          nullptr, key.c_str(), nullptr))
               == LIBSSH2_ERROR_EAGAIN) {
            if (steady_clock::now() >= deadline) break;
            wait_socket(100);
        }
        if (ret == 0) return Result<void>::Ok();
        if (callback) callback("Public key rejected, trying password...");
    }

    if (!target_.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{target_.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (steady_clock::now() >= deadline) break;
            wait_socket(100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Result<void>::Ok();
    }

    if (!target_.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (steady_clock::now() >= deadline) break;
            wait_socket(100);
        }
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(fmt::format("SSH authentication as {} failed (methods: {})",
                                         target_.user, methods.empty() ? "?" : methods));
}

Result<void> SshChannel::open_shell() {
    auto deadline = steady_clock::now() + seconds(target_.timeout);
    int ret;

    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            steady_clock::now() >= deadline) {
            return Result<void>::Err("Failed to open SSH channel");
        }
        wait_socket(100);
    }

    // Wide terminal so the device never wraps command echoes
    while ((ret = libssh2_channel_request_pty_ex(
                channel_, "vt100", 5, nullptr, 0, 511, 24, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        if (steady_clock::now() >= deadline) break;
        wait_socket(100);
    }
    if (ret != 0) {
        return Result<void>::Err("Failed to request PTY");
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (steady_clock::now() >= deadline) break;
        wait_socket(100);
    }
    if (ret != 0) {
        return Result<void>::Err("Failed to request shell");
    }
    return Result<void>::Ok();
}

Result<void> SshChannel::send(const std::string& text) {
    if (!channel_) {
        return Result<void>::Err("No channel available");
    }

    size_t written = 0;
    auto deadline = steady_clock::now() + seconds(target_.timeout);
    while (written < text.size()) {
        ssize_t n = libssh2_channel_write(channel_, text.c_str() + written,
                                          text.size() - written);
        if (n == LIBSSH2_ERROR_EAGAIN) {
            if (steady_clock::now() >= deadline) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)");
            }
            wait_socket(READ_POLL_MS);
            continue;
        }
        if (n < 0) {
            return Result<void>::Err(fmt::format("Channel write error ({})", n));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

ReadChunk SshChannel::read_some(milliseconds wait) {
    ReadChunk chunk;
    if (!channel_) {
        chunk.eof = true;
        return chunk;
    }

    char buf[SSH_READ_BUF_SIZE];
    auto deadline = steady_clock::now() + wait;
    while (true) {
        ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (n > 0) {
            chunk.data.append(buf, static_cast<size_t>(n));
            continue;   // take whatever else is already buffered
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            backup_log(fmt::format("[{}] channel read error {}", target_.host, n));
            chunk.eof = true;
            return chunk;
        }
        if (libssh2_channel_eof(channel_)) {
            chunk.eof = true;
            return chunk;
        }
        if (!chunk.data.empty()) return chunk;

        auto now = steady_clock::now();
        if (now >= deadline) return chunk;
        int remaining = static_cast<int>(duration_cast<milliseconds>(deadline - now).count());
        platform::poll_socket(sock_, POLLIN, std::max(1, remaining));
    }
}

void SshChannel::close() {
    if (channel_) {
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != ASABACKUP_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = ASABACKUP_INVALID_SOCKET;
    }
}
