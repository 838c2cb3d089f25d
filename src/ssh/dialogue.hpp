#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <atomic>
#include <optional>
#include <core/types.hpp>
#include "expect.hpp"
#include "channel.hpp"

// What to do when a rule's pattern shows up in the output
enum class RuleAction {
    ContinueWaiting,   // absorb it (progress, banners, warnings) and keep waiting
    Succeed,           // the dialogue is complete
    Fail,              // the dialogue failed with the rule's error kind
    Reissue,           // answer with the rule's reply, then keep waiting
};

struct DialogueRule {
    Pattern pattern;
    RuleAction action;
    std::string name;                            // shown in logs and error messages
    ErrorKind failure = ErrorKind::CommandFailed;
    std::string reply;                           // Reissue: sent verbatim
    int max_hits = 0;                            // Reissue: 0 = unlimited
};

DialogueRule absorb(const std::string& pattern, const std::string& name);
DialogueRule succeed_on(const std::string& pattern, const std::string& name);
DialogueRule fail_on(const std::string& pattern, ErrorKind kind, const std::string& name);
DialogueRule reply_to(const std::string& pattern, const std::string& reply,
                      const std::string& name, int max_hits = 0,
                      ErrorKind exhausted = ErrorKind::UnrecognizedOutput);

// One "send a line, classify what comes back" exchange.
//
// Rules are tried in declaration order on every wait and the first match
// wins, so tables list failure rules first, then absorbing rules, then the
// terminal rule. A Succeed match only counts once every rule named in
// `required` has matched earlier in the same dialogue.
struct Dialogue {
    std::string command;                  // sent with "\n"; empty = only wait
    std::vector<DialogueRule> rules;
    std::chrono::milliseconds timeout{30000};   // bound on each single wait
    std::vector<std::string> required;
};

struct DialogueOutcome {
    bool success = false;
    ErrorKind failure = ErrorKind::UnrecognizedOutput;
    std::string reason;
    std::string command;                  // secrets already redacted
    std::string matched_rule;             // rule that ended the dialogue
    std::vector<std::string> captures;    // groups of the terminal match
    std::string output;                   // consumed output, terminal match included
    std::set<std::string> seen;           // names of every rule that matched
    std::string discarded;                // drained after the dialogue ended

    bool saw(const std::string& rule_name) const { return seen.count(rule_name) > 0; }

    // Throws BackupError when the dialogue did not succeed.
    void raise() const;
};

// Interprets dialogues against one channel. Strictly sequential: a
// dialogue runs to completion (and the channel is drained) before the
// next one starts.
class DialogueEngine {
public:
    explicit DialogueEngine(SessionChannel& channel);

    void set_label(const std::string& label) { label_ = label; }
    void set_secrets(const std::vector<std::string>& secrets) { secrets_ = secrets; }
    void set_drain(std::chrono::milliseconds quiet, std::chrono::milliseconds max);

    // Whole-run bound: no wait may extend past it.
    void set_run_deadline(std::chrono::steady_clock::time_point deadline) { run_deadline_ = deadline; }
    void set_cancel_flag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    // Postcondition: the channel buffer is empty or the stream has ended.
    DialogueOutcome run(const Dialogue& dialogue);

private:
    SessionChannel& channel_;
    std::string label_ = "session";
    std::vector<std::string> secrets_;
    std::chrono::milliseconds drain_quiet_{200};
    std::chrono::milliseconds drain_max_{2000};
    std::optional<std::chrono::steady_clock::time_point> run_deadline_;
    const std::atomic<bool>* cancel_ = nullptr;

    DialogueOutcome interpret(const Dialogue& dialogue);
};
