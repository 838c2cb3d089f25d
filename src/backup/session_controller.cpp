#include "session_controller.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace std::chrono;

// ── Shared rule fragments ────────────────────────────────────

static const char* INVALID_INPUT = R"(Invalid input detected[^\r\n]*)";
// Error lines count only once complete: "ERROR: % Invalid input detected"
// must reach the invalid-input rule whole.
static const char* PERCENT_ERROR = R"(%Error[^\r\n]*[\r\n])";
static const char* ASA_ERROR     = R"(ERROR:[^\r\n]*[\r\n])";
static const char* MORE_PROMPT   = R"(<--- More --->)";

static DialogueRule more_rule() {
    return reply_to(MORE_PROMPT, " ", "more");
}

// ── SessionController ────────────────────────────────────────

SessionController::SessionController(ControllerOptions options, std::string secret)
    : options_(std::move(options)), secret_(std::move(secret)) {}

SessionController::~SessionController() {
    close();
}

DialogueOutcome SessionController::run(const Dialogue& dialogue) {
    if (!engine_ || !session_.channel || !session_.channel->is_open()) {
        throw BackupError(ErrorKind::Connection, "ConnectionError: session is not connected",
                          redact(dialogue.command, {secret_}));
    }
    auto outcome = engine_->run(dialogue);
    outcome.raise();
    return outcome;
}

Dialogue SessionController::prompt_dialogue(const std::string& command,
                                            std::vector<DialogueRule> rules,
                                            milliseconds timeout) const {
    Dialogue d;
    d.command = command;
    d.rules = std::move(rules);
    d.rules.push_back(more_rule());
    d.rules.push_back(DialogueRule{*session_.prompt, RuleAction::Succeed, "prompt"});
    d.timeout = timeout;
    return d;
}

void SessionController::connect(const ChannelOpener& opener) {
    auto opened = opener();
    if (opened.is_err()) {
        throw BackupError(ErrorKind::Connection, "ConnectionError: " + opened.error);
    }
    session_.channel = std::move(opened.value);

    engine_ = std::make_unique<DialogueEngine>(*session_.channel);
    engine_->set_label(options_.label);
    engine_->set_secrets({secret_});
    engine_->set_drain(options_.drain_quiet, options_.drain_max);
    if (options_.run_deadline) engine_->set_run_deadline(*options_.run_deadline);
    engine_->set_cancel_flag(options_.cancel);

    // Login banners and the message of the day come before the first prompt
    Dialogue login;
    login.rules.push_back(more_rule());
    login.rules.push_back(succeed_on(GENERIC_PROMPT, "prompt"));
    login.timeout = options_.probe_timeout;
    auto outcome = run(login);

    session_.hostname = outcome.captures.at(0);
    session_.prompt.emplace(prompt_pattern_for(session_.hostname));
    session_.elevated = outcome.captures.at(1) == "#";
    backup_log(fmt::format("[{}] connected, device hostname '{}', {}", options_.label,
                           session_.hostname, session_.elevated ? "privileged" : "unprivileged"));
}

void SessionController::elevate() {
    if (session_.elevated) {
        backup_log(fmt::format("[{}] already privileged, skipping enable", options_.label));
        return;
    }

    std::string command = options_.enable_level > 0
        ? fmt::format("enable {}", options_.enable_level)
        : std::string("enable");

    // A second password prompt means the first answer was rejected
    auto d = prompt_dialogue(command, {
        fail_on("Invalid password", ErrorKind::Authentication, "invalid-password"),
        fail_on("Access denied", ErrorKind::Authentication, "access-denied"),
        reply_to(R"([Pp]assword: ?$)", secret_ + "\n", "password", 1, ErrorKind::Authentication),
    }, options_.probe_timeout);
    auto outcome = run(d);

    if (outcome.captures.empty() || outcome.captures[0] != "#") {
        throw BackupError(ErrorKind::Authentication,
                          "AuthenticationError: enable did not reach privileged mode", command);
    }
    session_.elevated = true;
}

void SessionController::disable_pager() {
    // Not every context accepts it; "<--- More --->" is answered anyway
    run(prompt_dialogue("terminal pager 0", {}, options_.probe_timeout));
}

// ── Probing ──────────────────────────────────────────────────

SoftwareVersion SessionController::probe_version() {
    auto outcome = run(prompt_dialogue("show version | include Version", {},
                                       options_.probe_timeout));
    auto version = parse_version(outcome.output);
    if (!version.known) {
        backup_log(fmt::format("[{}] version not recognized, using the legacy path", options_.label));
    }
    return version;
}

ContextMode SessionController::probe_context_mode() {
    auto outcome = run(prompt_dialogue("show mode", {
        fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
    }, options_.probe_timeout));

    auto mode = parse_context_mode(outcome.output);
    if (!mode) {
        throw BackupError(ErrorKind::UnrecognizedOutput,
                          "UnrecognizedOutputError: no 'Security context mode' line in the response",
                          "show mode");
    }

    if (*mode == ContextMode::Multiple) {
        run(prompt_dialogue("changeto system", {
            fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
            fail_on(ASA_ERROR, ErrorKind::CommandFailed, "error"),
        }, options_.probe_timeout));
        session_.partition = SYSTEM_CONTEXT;
    }
    return *mode;
}

std::vector<std::string> SessionController::probe_contexts() {
    auto outcome = run(prompt_dialogue("show context", {
        fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
    }, options_.probe_timeout));
    return parse_contexts(outcome.output);
}

std::string SessionController::probe_nat_override() {
    auto command = fmt::format("show interface {} | include ^Interface", NAT_PROBE_INTERFACE);
    auto outcome = run(prompt_dialogue(command, {
        absorb(INVALID_INPUT, "invalid-input"),
        absorb(ASA_ERROR, "error"),
        absorb(fmt::format(R"(Interface [^\r\n]*{}[^\r\n]*is up)", NAT_PROBE_INTERFACE), "inside-up"),
    }, options_.probe_timeout));
    return outcome.saw("inside-up") ? NAT_OVERRIDE_TOKEN : "";
}

bool SessionController::probe_failover() {
    auto outcome = run(prompt_dialogue("show failover | include ^Failover (On|Off)", {
        absorb(INVALID_INPUT, "invalid-input"),
        absorb(ASA_ERROR, "error"),
    }, options_.probe_timeout));
    return parse_failover(outcome.output);
}

DeviceFacts SessionController::probe() {
    if (!session_.elevated) {
        throw BackupError(ErrorKind::Authentication, "AuthenticationError: probing requires a privileged session");
    }
    disable_pager();

    DeviceFacts facts;
    facts.version = probe_version();
    facts.mode = probe_context_mode();
    facts.failover = probe_failover();
    if (facts.mode == ContextMode::Multiple) {
        facts.contexts = probe_contexts();
    } else {
        facts.nat_override = probe_nat_override();
    }

    backup_log(fmt::format("[{}] version {}, mode {}, failover {}, contexts [{}], nat override '{}'",
                           options_.label, facts.version.str(), context_mode_name(facts.mode),
                           facts.failover ? "on" : "off", fmt::join(facts.contexts, ", "),
                           facts.nat_override));
    return facts;
}

// ── Unit dialogues ───────────────────────────────────────────

std::string SessionController::on_unit(FailoverRole role, const std::string& command) {
    return role == FailoverRole::Standby ? STANDBY_EXEC_PREFIX + command : command;
}

void SessionController::stage_tech_support(const std::string& file, FailoverRole role) {
    run(prompt_dialogue(on_unit(role, fmt::format("show tech-support file flash:/{}", file)), {
        fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
        fail_on(PERCENT_ERROR, ErrorKind::CommandFailed, "error"),
        fail_on(ASA_ERROR, ErrorKind::CommandFailed, "error"),
        absorb(R"([^\r\n]*[Ss]ignature[^\r\n]*)", "signature-warning"),
    }, options_.transfer_timeout));
}

void SessionController::stage_backup(const std::optional<std::string>& context,
                                     const std::string& file, FailoverRole role) {
    std::string scope = context ? fmt::format("context {} ", *context) : std::string();
    auto command = fmt::format("backup /noconfirm {}passphrase {} location flash:/{}",
                               scope, secret_, file);

    auto d = prompt_dialogue(on_unit(role, command), {
        fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
        fail_on(PERCENT_ERROR, ErrorKind::CommandFailed, "error"),
        fail_on(ASA_ERROR, ErrorKind::CommandFailed, "error"),
        absorb(R"(WARNING: [^\r\n]*[Ff]ailover[^\r\n]*)", "failover-warning"),
        absorb(R"(Begin backup[^\r\n]*)", "begin"),
        absorb(R"(Backing up[^\r\n]*)", "backing-up"),
        absorb(R"(Compressing[^\r\n]*)", "compressing"),
        absorb(R"(Copying Backup[^\r\n]*)", "copying"),
        absorb(R"(Cleaning up[^\r\n]*)", "cleaning-up"),
        absorb(R"(Backup finished!)", "finished"),
    }, options_.transfer_timeout);
    d.required = {"finished"};
    run(d);
}

void SessionController::copy_to_destination(const std::string& source, const std::string& url,
                                            const std::string& file,
                                            const std::string& nat_override,
                                            FailoverRole role) {
    auto command = fmt::format("copy /noconfirm {} {}/{}{}", source, url, file, nat_override);
    auto d = prompt_dialogue(on_unit(role, command), {
        fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
        fail_on(PERCENT_ERROR, ErrorKind::CommandFailed, "error"),
        reply_to(R"(\(yes/no\))", "yes\n", "confirm", 1),
        absorb(R"([0-9]+ bytes copied[^\r\n]*)", "copied"),
    }, options_.transfer_timeout);
    d.required = {"copied"};
    run(d);
}

void SessionController::delete_from_flash(const std::string& file, FailoverRole role) {
    run(prompt_dialogue(on_unit(role, fmt::format("delete /noconfirm flash:/{}", file)), {
        fail_on(PERCENT_ERROR, ErrorKind::CommandFailed, "error"),
    }, options_.probe_timeout));
}

std::string SessionController::lookup_config_url(const std::string& context) {
    auto command = fmt::format("show run context {} | include config-url", context);
    auto outcome = run(prompt_dialogue(command, {
        fail_on(INVALID_INPUT, ErrorKind::UnsupportedOperation, "invalid-input"),
        fail_on(ASA_ERROR, ErrorKind::CommandFailed, "error"),
    }, options_.probe_timeout));

    std::string url = parse_config_url(outcome.output);
    if (url.empty()) {
        throw BackupError(ErrorKind::CommandFailed,
                          fmt::format("CommandFailedError: context {} has no config-url", context),
                          command);
    }
    return url;
}

void SessionController::copy_and_cleanup(const std::string& file, const std::string& url,
                                         const std::string& nat_override, FailoverRole role) {
    std::optional<BackupError> copy_error;
    try {
        copy_to_destination("flash:/" + file, url, file, nat_override, role);
    } catch (const BackupError& e) {
        copy_error = e;
    }

    if (copy_error && is_session_fatal(copy_error->kind())) {
        backup_log(fmt::format("[{}] flash:/{} left in place, session unusable", options_.label, file));
        throw *copy_error;
    }

    try {
        delete_from_flash(file, role);
    } catch (const BackupError& e) {
        if (!copy_error) throw;
        backup_log(fmt::format("[{}] cleanup after failed copy also failed: {}", options_.label, e.what()));
        // A fatal cleanup error still ends the session
        if (is_session_fatal(e.kind())) {
            throw BackupError(e.kind(),
                              fmt::format("{} (after failed copy: {})", e.what(), copy_error->what()),
                              e.command());
        }
    }

    if (copy_error) throw *copy_error;
}

void SessionController::run_unit(const BackupUnit& unit, const std::string& url,
                                 const DeviceFacts& facts) {
    if (session_.channel) {
        session_.channel->drain(options_.drain_quiet, options_.drain_max);
    }

    switch (unit.kind) {
    case UnitKind::TechSupport:
        stage_tech_support(unit.filename, unit.role);
        copy_and_cleanup(unit.filename, url, facts.nat_override, unit.role);
        break;

    case UnitKind::BackupArchive:
        // The backup command does not accept the NAT override, the copy does
        stage_backup(unit.context, unit.filename, unit.role);
        copy_and_cleanup(unit.filename, url, facts.nat_override, unit.role);
        break;

    case UnitKind::LegacyConfig:
        copy_to_destination(unit.source, url, unit.filename, facts.nat_override, unit.role);
        break;

    case UnitKind::ContextConfig: {
        // The config-url is system configuration, read on the active unit
        std::string source = lookup_config_url(unit.context.value_or(""));
        copy_to_destination(source, url, unit.filename, facts.nat_override, unit.role);
        break;
    }
    }
}

void SessionController::close() {
    engine_.reset();
    if (session_.channel) {
        session_.channel->close();
        session_.channel.reset();
    }
    session_.elevated = false;
}
