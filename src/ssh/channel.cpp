#include "channel.hpp"
#include <core/log.hpp>
#include <algorithm>

using namespace std::chrono;

// Upper bound on a single read so cancellation is noticed promptly.
static constexpr milliseconds MAX_READ_SLICE{100};

void SessionChannel::absorb(const ReadChunk& chunk) {
    if (!chunk.data.empty()) {
        if (transcript_) transcript_->received(chunk.data);
        buffer_.append(chunk.data);
    }
    if (chunk.eof) eof_ = true;
}

MatchResult SessionChannel::await_match(const std::vector<Pattern>& patterns,
                                        milliseconds timeout,
                                        const std::atomic<bool>* cancel) {
    auto deadline = steady_clock::now() + timeout;
    MatchResult result;

    while (true) {
        if (buffer_.match(patterns, result)) {
            return result;
        }

        if (eof_) {
            result.status = MatchStatus::EndOfStream;
            result.before_text = buffer_.data();
            return result;
        }

        if (cancel && cancel->load()) {
            result.status = MatchStatus::Cancelled;
            result.before_text = buffer_.data();
            return result;
        }

        auto now = steady_clock::now();
        if (now >= deadline) {
            result.status = MatchStatus::Timeout;
            result.before_text = buffer_.data();
            return result;
        }

        auto remaining = duration_cast<milliseconds>(deadline - now);
        absorb(read_some(std::min(remaining, MAX_READ_SLICE)));
    }
}

std::string SessionChannel::drain(milliseconds quiet, milliseconds max) {
    std::string discarded = buffer_.take();
    auto hard_stop = steady_clock::now() + max;

    while (!eof_ && steady_clock::now() < hard_stop) {
        auto chunk = read_some(quiet);
        if (chunk.data.empty() && !chunk.eof) break;
        if (!chunk.data.empty() && transcript_) transcript_->received(chunk.data);
        discarded += chunk.data;
        if (chunk.eof) eof_ = true;
    }
    return discarded;
}
