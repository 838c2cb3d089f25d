#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <atomic>
#include <core/types.hpp>
#include "expect.hpp"

class SessionLog;

struct ReadChunk {
    std::string data;
    bool eof = false;
};

// Duplex, interactive channel to a remote shell. Implementations supply
// raw byte I/O; pattern waiting and draining live here so every transport
// (and the test double) shares one matcher.
class SessionChannel {
public:
    virtual ~SessionChannel() = default;

    // Writes text as-is. No newline is appended.
    virtual Result<void> send(const std::string& text) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Waits until one of the patterns matches the buffered output, the
    // timeout elapses, the remote side closes, or *cancel turns true.
    MatchResult await_match(const std::vector<Pattern>& patterns,
                            std::chrono::milliseconds timeout,
                            const std::atomic<bool>* cancel = nullptr);

    // Discards buffered output plus anything arriving until the channel has
    // been silent for `quiet` (capped at `max`). Returns the discarded text.
    // Afterwards the buffer is empty or the stream has ended.
    std::string drain(std::chrono::milliseconds quiet, std::chrono::milliseconds max);

    size_t buffered() const { return buffer_.size(); }
    bool at_eof() const { return eof_; }

    // Everything received is mirrored here when set.
    void set_transcript(SessionLog* log) { transcript_ = log; }

protected:
    // Waits up to `wait` for output. Empty data and !eof means nothing
    // arrived in time.
    virtual ReadChunk read_some(std::chrono::milliseconds wait) = 0;

private:
    ExpectBuffer buffer_;
    SessionLog* transcript_ = nullptr;
    bool eof_ = false;

    void absorb(const ReadChunk& chunk);
};
