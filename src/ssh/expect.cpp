#include "expect.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

Pattern::Pattern(const std::string& pattern) : raw(pattern) {
    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error&) {
        regex = std::regex(regex_escape(pattern), std::regex::ECMAScript);
    }
}

void ExpectBuffer::append(const std::string& data) {
    buffer_ += data;
}

bool ExpectBuffer::match(const std::vector<Pattern>& patterns, MatchResult& result) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        std::smatch m;
        if (std::regex_search(buffer_, m, patterns[i].regex)) {
            result.status = MatchStatus::Matched;
            result.pattern_index = i;
            result.matched_text = m[0];
            result.before_text = buffer_.substr(0, m.position(0));
            result.groups.clear();
            for (size_t g = 1; g < m.size(); ++g) {
                result.groups.push_back(m[g].matched ? m[g].str() : std::string());
            }
            buffer_.erase(0, m.position(0) + m.length(0));
            return true;
        }
    }

    // Nothing matched anywhere in the buffer, so only a match that starts in
    // the tail and completes with later output is still possible.
    if (buffer_.size() > EXPECT_BUFFER_MAX) {
        buffer_.erase(0, buffer_.size() - EXPECT_BUFFER_KEEP);
    }
    return false;
}

std::string ExpectBuffer::take() {
    std::string out;
    out.swap(buffer_);
    return out;
}
