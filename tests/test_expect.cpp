#include <gtest/gtest.h>
#include <ssh/expect.hpp>
#include <core/constants.hpp>
#include "mock_channel.hpp"

using namespace std::chrono;

TEST(ExpectBuffer, FirstDeclaredPatternWins) {
    ExpectBuffer buf;
    buf.append("%Error opening file\r\nasa1# ");

    std::vector<Pattern> patterns = {Pattern("%Error"), Pattern("asa1# $")};
    MatchResult r;
    ASSERT_TRUE(buf.match(patterns, r));
    EXPECT_EQ(r.pattern_index, 0u);
    EXPECT_EQ(r.matched_text, "%Error");
}

TEST(ExpectBuffer, ConsumesThroughEndOfMatch) {
    ExpectBuffer buf;
    buf.append("banner\r\nBackup finished!\r\nasa1# ");

    std::vector<Pattern> patterns = {Pattern("Backup finished!")};
    MatchResult r;
    ASSERT_TRUE(buf.match(patterns, r));
    EXPECT_EQ(r.before_text, "banner\r\n");
    EXPECT_EQ(buf.data(), "\r\nasa1# ");

    // Consumed text never matches again
    EXPECT_FALSE(buf.match(patterns, r));
}

TEST(ExpectBuffer, CapturesGroups) {
    ExpectBuffer buf;
    buf.append("\r\nfw-edge/admin# ");

    std::vector<Pattern> patterns = {Pattern(R"(([A-Za-z0-9-]+)(?:/([a-z]+))?([>#]) ?$)")};
    MatchResult r;
    ASSERT_TRUE(buf.match(patterns, r));
    ASSERT_EQ(r.groups.size(), 3u);
    EXPECT_EQ(r.groups[0], "fw-edge");
    EXPECT_EQ(r.groups[1], "admin");
    EXPECT_EQ(r.groups[2], "#");
}

TEST(ExpectBuffer, UnmatchedOptionalGroupIsEmpty) {
    ExpectBuffer buf;
    buf.append("asa1> ");

    std::vector<Pattern> patterns = {Pattern(R"(([a-z0-9]+)(?:/([a-z]+))?([>#]) ?$)")};
    MatchResult r;
    ASSERT_TRUE(buf.match(patterns, r));
    EXPECT_EQ(r.groups[1], "");
    EXPECT_EQ(r.groups[2], ">");
}

TEST(ExpectBuffer, InvalidRegexMatchesLiterally) {
    Pattern p("(yes/no");
    ExpectBuffer buf;
    buf.append("Continue (yes/no? ");

    MatchResult r;
    ASSERT_TRUE(buf.match({p}, r));
    EXPECT_EQ(r.matched_text, "(yes/no");
}

TEST(ExpectBuffer, KeepsTailOfOversizedOutputAfterFailedMatch) {
    ExpectBuffer buf;
    buf.append(std::string(EXPECT_BUFFER_MAX, '.'));
    buf.append("..tail");
    EXPECT_EQ(buf.size(), EXPECT_BUFFER_MAX + 6);

    MatchResult r;
    EXPECT_FALSE(buf.match({Pattern("never")}, r));
    EXPECT_EQ(buf.size(), EXPECT_BUFFER_KEEP);
    EXPECT_EQ(buf.data().substr(buf.size() - 4), "tail");
}

TEST(ExpectBuffer, LargeChunkIsMatchedBeforeTrimming) {
    ExpectBuffer buf;
    buf.append(std::string(60 * 1024, '!'));
    buf.append("\r\n%Error writing flash:/x (No space left on device)\r\n" +
               std::string(9000, '!') + "\r\nasa1# ");

    std::vector<Pattern> patterns = {Pattern(R"(%Error[^\r\n]*[\r\n])"), Pattern(R"(asa1# $)")};
    MatchResult r;
    ASSERT_TRUE(buf.match(patterns, r));
    EXPECT_EQ(r.pattern_index, 0u);
    EXPECT_NE(r.matched_text.find("No space left"), std::string::npos);
}

TEST(ExpectBuffer, TakeEmptiesBuffer) {
    ExpectBuffer buf;
    buf.append("leftover");
    EXPECT_EQ(buf.take(), "leftover");
    EXPECT_EQ(buf.size(), 0u);
}

// ── SessionChannel waiting ──────────────────────────────────

TEST(SessionChannelWait, MatchesAcrossChunks) {
    MockChannel ch;
    ch.queue("Backup fin");
    ch.queue("ished!\r\n");

    auto r = ch.await_match({Pattern("Backup finished!")}, milliseconds(200));
    EXPECT_TRUE(r.matched());
    EXPECT_EQ(ch.buffered(), 2u);
}

TEST(SessionChannelWait, EndOfStreamKeepsLeftover) {
    MockChannel ch;
    ch.queue("partial output");
    ch.close_after_pending();

    auto r = ch.await_match({Pattern("never")}, milliseconds(200));
    EXPECT_EQ(r.status, MatchStatus::EndOfStream);
    EXPECT_EQ(r.before_text, "partial output");
    EXPECT_TRUE(ch.at_eof());
}

TEST(SessionChannelWait, TimesOut) {
    MockChannel ch;
    ch.queue("nothing useful");

    auto start = steady_clock::now();
    auto r = ch.await_match({Pattern("never")}, milliseconds(30));
    EXPECT_EQ(r.status, MatchStatus::Timeout);
    EXPECT_GE(steady_clock::now() - start, milliseconds(30));
}

TEST(SessionChannelWait, DrainDiscardsBufferedAndLateOutput) {
    MockChannel ch;
    ch.queue("asa1# extra");
    ch.queue(" and late");

    auto r = ch.await_match({Pattern("asa1# ")}, milliseconds(200));
    ASSERT_TRUE(r.matched());

    std::string discarded = ch.drain(milliseconds(1), milliseconds(50));
    EXPECT_EQ(discarded, "extra and late");
    EXPECT_EQ(ch.unread_bytes(), 0u);
}
