#pragma once

#include <string>
#include <vector>
#include <regex>

struct Pattern {
    std::regex regex;
    std::string raw;

    // ECMAScript syntax. A pattern that does not compile is matched as a
    // literal string instead.
    Pattern(const std::string& pattern);
};

enum class MatchStatus {
    Matched,
    Timeout,
    EndOfStream,
    Cancelled,
};

struct MatchResult {
    MatchStatus status = MatchStatus::Timeout;
    size_t pattern_index = 0;
    std::string matched_text;
    std::string before_text;           // output consumed ahead of the match
    std::vector<std::string> groups;   // capture groups 1..n of the match

    bool matched() const { return status == MatchStatus::Matched; }
};

// Output that arrived but has not been consumed by a match yet.
// Patterns are tried in declaration order; the first one that matches
// anywhere in the buffer wins, and the buffer is consumed through the end
// of that match. Whatever follows stays for the next wait. Oversized output
// is cut down to its tail only after a failed match has checked all of it.
class ExpectBuffer {
public:
    void append(const std::string& data);
    bool match(const std::vector<Pattern>& patterns, MatchResult& result);

    // Returns everything buffered and leaves the buffer empty.
    std::string take();
    void clear() { buffer_.clear(); }

    const std::string& data() const { return buffer_; }
    size_t size() const { return buffer_.size(); }

private:
    std::string buffer_;
};
