#include <gtest/gtest.h>
#include <ssh/dialogue.hpp>
#include "mock_channel.hpp"
#include <atomic>

using namespace std::chrono;

static const char* PROMPT = R"((?:^|[\r\n])asa1([>#]) ?$)";

// Answers every command with the given chunks, in order.
static MockChannel::Responder answer(std::vector<std::string> chunks) {
    return [chunks](const std::string&) { return chunks; };
}

static DialogueEngine make_engine(MockChannel& ch) {
    DialogueEngine engine(ch);
    engine.set_drain(milliseconds(1), milliseconds(20));
    return engine;
}

TEST(Dialogue, SucceedsOnTerminalRuleWithCaptures) {
    MockChannel ch(answer({"show clock\r\n12:00:00 UTC\r\nasa1# "}));
    auto engine = make_engine(ch);

    Dialogue d{"show clock", {succeed_on(PROMPT, "prompt")}, milliseconds(500)};
    auto out = engine.run(d);

    EXPECT_TRUE(out.success);
    EXPECT_EQ(out.matched_rule, "prompt");
    ASSERT_EQ(out.captures.size(), 1u);
    EXPECT_EQ(out.captures[0], "#");
    EXPECT_NE(out.output.find("12:00:00 UTC"), std::string::npos);
    ASSERT_EQ(ch.sent().size(), 1u);
    EXPECT_EQ(ch.sent()[0], "show clock\n");
}

TEST(Dialogue, FailureRuleWinsOverPromptInSameOutput) {
    MockChannel ch(answer({"copy x y\r\n%Error copying x (No such file)\r\nasa1# "}));
    auto engine = make_engine(ch);

    Dialogue d{"copy x y", {
        fail_on(R"(%Error[^\r\n]*)", ErrorKind::CommandFailed, "error"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500)};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::CommandFailed);
    EXPECT_EQ(out.matched_rule, "error");
    EXPECT_NE(out.reason.find("No such file"), std::string::npos);
}

TEST(Dialogue, NeverSucceedsAfterFailureMatched) {
    // Failure text arrives first, the prompt only in a later chunk
    MockChannel ch(answer({"backup\r\nERROR: disk full\r\n", "asa1# "}));
    auto engine = make_engine(ch);

    Dialogue d{"backup", {
        fail_on(R"(ERROR:[^\r\n]*)", ErrorKind::CommandFailed, "error"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500)};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.matched_rule, "error");
    EXPECT_TRUE(out.captures.empty());
}

TEST(Dialogue, AbsorbsProgressBannersBeforeSucceeding) {
    MockChannel ch(answer({
        "backup\r\nBegin backup...\r\n",
        "Compressing ... Done!\r\n",
        "Backup finished!\r\nasa1# ",
    }));
    auto engine = make_engine(ch);

    Dialogue d{"backup", {
        absorb("Begin backup", "begin"),
        absorb("Compressing", "compressing"),
        absorb("Backup finished!", "finished"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500), {"finished"}};
    auto out = engine.run(d);

    EXPECT_TRUE(out.success);
    EXPECT_TRUE(out.saw("begin"));
    EXPECT_TRUE(out.saw("compressing"));
    EXPECT_TRUE(out.saw("finished"));
}

TEST(Dialogue, MissingRequiredRuleIsUnrecognizedOutput) {
    MockChannel ch(answer({"copy a b\r\nsomething else happened\r\nasa1# "}));
    auto engine = make_engine(ch);

    Dialogue d{"copy a b", {
        absorb(R"([0-9]+ bytes copied)", "copied"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500), {"copied"}};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::UnrecognizedOutput);
    EXPECT_NE(out.reason.find("copied"), std::string::npos);
}

TEST(Dialogue, TimeoutWhenNothingMatches) {
    MockChannel ch(answer({"show run\r\nstill thinking"}));
    auto engine = make_engine(ch);

    Dialogue d{"show run", {succeed_on(PROMPT, "prompt")}, milliseconds(50)};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::Timeout);
    EXPECT_NE(out.reason.find("still thinking"), std::string::npos);
    EXPECT_EQ(out.command, "show run");
}

TEST(Dialogue, EndOfStreamWithLeftoverOutputIsUnrecognized) {
    MockChannel ch(answer({"show run\r\nSegmentation fault\r\n"}));
    ch.close_after_pending();
    auto engine = make_engine(ch);

    Dialogue d{"show run", {succeed_on(PROMPT, "prompt")}, milliseconds(500)};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::UnrecognizedOutput);
    EXPECT_NE(out.reason.find("Segmentation fault"), std::string::npos);
}

TEST(Dialogue, EndOfStreamAfterEchoIsConnectionError) {
    MockChannel ch(answer({"show run\r\n"}));
    ch.close_after_pending();
    auto engine = make_engine(ch);

    Dialogue d{"show run", {succeed_on(PROMPT, "prompt")}, milliseconds(500)};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::Connection);
}

TEST(Dialogue, ReissueAnswersPromptThenContinues) {
    int round = 0;
    MockChannel ch([&](const std::string& text) -> std::vector<std::string> {
        ++round;
        if (round == 1) return {"copy a b\r\nContinue (yes/no)? "};
        if (text == "yes\n") return {"\r\n100 bytes copied\r\nasa1# "};
        return {};
    });
    auto engine = make_engine(ch);

    Dialogue d{"copy a b", {
        reply_to(R"(\(yes/no\))", "yes\n", "confirm", 1),
        absorb(R"([0-9]+ bytes copied)", "copied"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500), {"copied"}};
    auto out = engine.run(d);

    EXPECT_TRUE(out.success);
    ASSERT_EQ(ch.sent().size(), 2u);
    EXPECT_EQ(ch.sent()[1], "yes\n");
}

TEST(Dialogue, ReissueLimitFailsWithConfiguredKind) {
    MockChannel ch([](const std::string&) -> std::vector<std::string> {
        return {"\r\nPassword: "};
    });
    auto engine = make_engine(ch);

    Dialogue d{"enable 15", {
        reply_to(R"([Pp]assword: ?$)", "wrong\n", "password", 1, ErrorKind::Authentication),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500)};
    auto out = engine.run(d);

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::Authentication);
    EXPECT_EQ(ch.sent().size(), 2u);   // command + one answer
}

TEST(Dialogue, ErrorInsideOversizedChunkIsNotLost) {
    MockChannel ch(answer({
        "copy a b\r\n" + std::string(60 * 1024, '!'),
        "\r\n%Error writing flash:/x (No space left on device)\r\n" +
            std::string(9000, '!') + "\r\nasa1# ",
    }));
    auto engine = make_engine(ch);

    auto out = engine.run({"copy a b", {
        fail_on(R"(%Error[^\r\n]*[\r\n])", ErrorKind::CommandFailed, "error"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(2000)});

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::CommandFailed);
    EXPECT_NE(out.reason.find("No space left"), std::string::npos);
}

TEST(Dialogue, DrainsLateOutputSoNextDialogueStartsClean) {
    MockChannel ch(answer({"show mode\r\nasa1# ", "\r\n%Error late message\r\nasa1# "}));
    auto engine = make_engine(ch);

    Dialogue first{"show mode", {succeed_on(PROMPT, "prompt")}, milliseconds(500)};
    auto out = engine.run(first);

    EXPECT_TRUE(out.success);
    EXPECT_EQ(ch.unread_bytes(), 0u);
    EXPECT_NE(out.discarded.find("late message"), std::string::npos);
}

TEST(Dialogue, NoGhostMatchFromPreviousDialogue) {
    int round = 0;
    MockChannel ch([&](const std::string&) -> std::vector<std::string> {
        ++round;
        if (round == 1) return {"first\r\nasa1# ", "\r\nasa1# "};   // a stray extra prompt
        return {"second\r\nworking"};                               // never finishes
    });
    auto engine = make_engine(ch);

    EXPECT_TRUE(engine.run({"first", {succeed_on(PROMPT, "prompt")}, milliseconds(500)}).success);

    auto out = engine.run({"second", {succeed_on(PROMPT, "prompt")}, milliseconds(50)});
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::Timeout);
}

TEST(Dialogue, FailedDialogueIsDrainedToo) {
    MockChannel ch(answer({"x\r\n%Error one\r\n", "more noise\r\nasa1# "}));
    auto engine = make_engine(ch);

    auto out = engine.run({"x", {
        fail_on(R"(%Error[^\r\n]*)", ErrorKind::CommandFailed, "error"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500)});

    EXPECT_FALSE(out.success);
    EXPECT_EQ(ch.unread_bytes(), 0u);
}

TEST(Dialogue, CancelFlagStopsWaiting) {
    MockChannel ch(answer({"show tech\r\n..."}));
    auto engine = make_engine(ch);
    std::atomic<bool> cancel{true};
    engine.set_cancel_flag(&cancel);

    auto out = engine.run({"show tech", {succeed_on(PROMPT, "prompt")}, milliseconds(5000)});
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::Cancelled);
}

TEST(Dialogue, RunDeadlineBoundsEachWait) {
    MockChannel ch(answer({"show tech\r\n..."}));
    auto engine = make_engine(ch);
    engine.set_run_deadline(steady_clock::now() + milliseconds(30));

    auto start = steady_clock::now();
    auto out = engine.run({"show tech", {succeed_on(PROMPT, "prompt")}, milliseconds(10000)});

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failure, ErrorKind::Cancelled);
    EXPECT_LT(steady_clock::now() - start, milliseconds(2000));
}

TEST(Dialogue, SecretsAreRedactedInOutcome) {
    MockChannel ch(answer({"backup passphrase hunter2\r\n%Error bad passphrase hunter2\r\nasa1# "}));
    auto engine = make_engine(ch);
    engine.set_secrets({"hunter2"});

    auto out = engine.run({"backup passphrase hunter2", {
        fail_on(R"(%Error[^\r\n]*)", ErrorKind::CommandFailed, "error"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500)});

    EXPECT_EQ(out.command, "backup passphrase ********");
    EXPECT_EQ(out.reason.find("hunter2"), std::string::npos);
    EXPECT_EQ(ch.sent()[0], "backup passphrase hunter2\n");
}

TEST(Dialogue, RaiseThrowsWithKindAndCommand) {
    MockChannel ch(answer({"x\r\n%Error nope\r\nasa1# "}));
    auto engine = make_engine(ch);

    auto out = engine.run({"x", {
        fail_on(R"(%Error[^\r\n]*)", ErrorKind::CommandFailed, "error"),
        succeed_on(PROMPT, "prompt"),
    }, milliseconds(500)});

    try {
        out.raise();
        FAIL() << "expected BackupError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CommandFailed);
        EXPECT_EQ(e.command(), "x");
        EXPECT_NE(std::string(e.what()).find("CommandError"), std::string::npos);
    }
}

TEST(Dialogue, WaitOnlyDialogueSendsNothing) {
    MockChannel ch;
    ch.queue("Welcome\r\nasa1> ");
    auto engine = make_engine(ch);

    Dialogue d;
    d.rules.push_back(succeed_on(PROMPT, "prompt"));
    d.timeout = milliseconds(500);
    auto out = engine.run(d);

    EXPECT_TRUE(out.success);
    EXPECT_TRUE(ch.sent().empty());
    EXPECT_EQ(out.captures[0], ">");
}
