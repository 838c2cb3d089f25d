#include "dialogue.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <map>
#include <fmt/format.h>

using namespace std::chrono;

// ── Rule builders ────────────────────────────────────────────

DialogueRule absorb(const std::string& pattern, const std::string& name) {
    return DialogueRule{Pattern(pattern), RuleAction::ContinueWaiting, name};
}

DialogueRule succeed_on(const std::string& pattern, const std::string& name) {
    return DialogueRule{Pattern(pattern), RuleAction::Succeed, name};
}

DialogueRule fail_on(const std::string& pattern, ErrorKind kind, const std::string& name) {
    return DialogueRule{Pattern(pattern), RuleAction::Fail, name, kind};
}

DialogueRule reply_to(const std::string& pattern, const std::string& reply,
                      const std::string& name, int max_hits, ErrorKind exhausted) {
    return DialogueRule{Pattern(pattern), RuleAction::Reissue, name, exhausted, reply, max_hits};
}

// ── DialogueOutcome ──────────────────────────────────────────

void DialogueOutcome::raise() const {
    if (success) return;
    std::string cmd = command.empty() ? "<wait for prompt>" : command;
    throw BackupError(failure,
                      fmt::format("{}: {} [command: {}]", error_kind_name(failure), reason, cmd),
                      command);
}

// Last non-empty line of device output, for error messages.
static std::string last_line(const std::string& text) {
    auto lines = split_lines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string line = *it;
        trim(line);
        if (!line.empty()) return line.substr(0, 200);
    }
    return "";
}

// ── DialogueEngine ───────────────────────────────────────────

DialogueEngine::DialogueEngine(SessionChannel& channel) : channel_(channel) {}

void DialogueEngine::set_drain(milliseconds quiet, milliseconds max) {
    drain_quiet_ = quiet;
    drain_max_ = max;
}

DialogueOutcome DialogueEngine::run(const Dialogue& dialogue) {
    auto t0 = steady_clock::now();
    DialogueOutcome outcome = interpret(dialogue);

    // Nothing from this exchange may leak into the next one.
    outcome.discarded = channel_.drain(drain_quiet_, drain_max_);

    double secs = duration_cast<milliseconds>(steady_clock::now() - t0).count() / 1000.0;
    std::string status = outcome.success
        ? fmt::format("ok (matched '{}')", outcome.matched_rule)
        : fmt::format("FAILED {}: {}", error_kind_name(outcome.failure), outcome.reason);
    backup_log_dialogue(label_, outcome.command, redact(status, secrets_), secs);
    if (!outcome.discarded.empty()) {
        backup_log(fmt::format("[{}] drained {} bytes after dialogue", label_, outcome.discarded.size()));
    }
    return outcome;
}

DialogueOutcome DialogueEngine::interpret(const Dialogue& dialogue) {
    DialogueOutcome outcome;
    outcome.command = redact(dialogue.command, secrets_);

    auto fail = [&](ErrorKind kind, const std::string& reason) {
        outcome.success = false;
        outcome.failure = kind;
        outcome.reason = redact(reason, secrets_);
        return outcome;
    };

    if (!dialogue.command.empty()) {
        auto sent = channel_.send(dialogue.command + "\n");
        if (sent.is_err()) {
            return fail(ErrorKind::Connection, "send failed: " + sent.error);
        }
    }

    std::vector<Pattern> patterns;
    patterns.reserve(dialogue.rules.size());
    for (const auto& rule : dialogue.rules) {
        patterns.push_back(rule.pattern);
    }

    std::map<size_t, int> hits;

    while (true) {
        auto timeout = dialogue.timeout;
        bool bounded_by_run = false;
        if (run_deadline_) {
            auto now = steady_clock::now();
            if (now >= *run_deadline_) {
                return fail(ErrorKind::Cancelled, "run deadline exceeded");
            }
            auto left = duration_cast<milliseconds>(*run_deadline_ - now);
            if (left < timeout) {
                timeout = left;
                bounded_by_run = true;
            }
        }

        auto m = channel_.await_match(patterns, timeout, cancel_);
        if (outcome.output.size() < DIALOGUE_OUTPUT_MAX) {
            outcome.output += m.before_text;
            outcome.output += m.matched_text;
        }

        switch (m.status) {
        case MatchStatus::Timeout: {
            if (bounded_by_run) {
                return fail(ErrorKind::Cancelled, "run deadline exceeded");
            }
            std::string tail = last_line(m.before_text);
            return fail(ErrorKind::Timeout,
                        fmt::format("no expected response within {}s{}",
                                    dialogue.timeout.count() / 1000,
                                    tail.empty() ? "" : "; last output: '" + tail + "'"));
        }

        case MatchStatus::Cancelled:
            return fail(ErrorKind::Cancelled, "interrupted");

        case MatchStatus::EndOfStream: {
            // The echo of our own command is not device output
            std::string tail = last_line(m.before_text);
            if (tail.empty() || tail == last_line(dialogue.command)) {
                return fail(ErrorKind::Connection, "channel closed by the device");
            }
            return fail(ErrorKind::UnrecognizedOutput,
                        fmt::format("channel closed after unrecognized output '{}'", tail));
        }

        case MatchStatus::Matched:
            break;
        }

        const DialogueRule& rule = dialogue.rules[m.pattern_index];
        outcome.seen.insert(rule.name);

        switch (rule.action) {
        case RuleAction::ContinueWaiting:
            continue;

        case RuleAction::Reissue: {
            int count = ++hits[m.pattern_index];
            if (rule.max_hits > 0 && count > rule.max_hits) {
                outcome.matched_rule = rule.name;
                return fail(rule.failure,
                            fmt::format("'{}' repeated {} times", rule.name, count));
            }
            auto sent = channel_.send(rule.reply);
            if (sent.is_err()) {
                return fail(ErrorKind::Connection, "send failed: " + sent.error);
            }
            continue;
        }

        case RuleAction::Fail: {
            outcome.matched_rule = rule.name;
            std::string line = last_line(m.matched_text);
            return fail(rule.failure,
                        fmt::format("device reported '{}'", line.empty() ? rule.name : line));
        }

        case RuleAction::Succeed:
            outcome.matched_rule = rule.name;
            for (const auto& req : dialogue.required) {
                if (!outcome.saw(req)) {
                    return fail(ErrorKind::UnrecognizedOutput,
                                fmt::format("finished without '{}'; last output: '{}'",
                                            req, last_line(m.before_text)));
                }
            }
            outcome.success = true;
            outcome.captures = m.groups;
            return outcome;
        }
    }
}
