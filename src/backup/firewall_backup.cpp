#include "firewall_backup.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/secret_store.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/ssh_channel.hpp>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace std::chrono;

// Creates the destination directory, or touches it when it already exists,
// as long as the backup root is visible from here. Returns false when the
// destination only exists on the backup host.
static Result<bool> prepare_destination(const FirewallConfig& fw, const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(fw.backup_dir, ec)) {
        return Result<bool>::Ok(false);
    }

    if (fs::exists(dir, ec)) {
        fs::last_write_time(dir, fs::file_time_type::clock::now(), ec);
        if (ec) backup_log(fmt::format("[{}] touching {} failed: {}", fw.name, dir.string(), ec.message()));
        return Result<bool>::Ok(true);
    }

    fs::create_directories(dir, ec);
    if (ec) {
        return Result<bool>::Err(fmt::format("Creating directory {} failed: {}", dir.string(), ec.message()));
    }
    return Result<bool>::Ok(true);
}

static FirewallResult fail_early(FirewallResult result, ErrorKind kind, const std::string& message) {
    result.error = kind;
    result.message = fmt::format("{}: {}", error_kind_name(kind), message);
    backup_log(fmt::format("[{}] {}", result.name, result.message));
    return result;
}

FirewallResult backup_firewall(const FirewallConfig& fw, const std::atomic<bool>* cancel,
                               StatusCallback status, std::time_t now) {
    FirewallResult result;
    result.name = fw.name;
    result.hostname = fw.hostname;
    result.destination = fw.backup_dir + "/" + fw.name;

    auto problems = validate_firewall(fw);
    if (!problems.empty()) {
        return fail_early(result, ErrorKind::Configuration, problems.front());
    }

    if (!platform::is_resolvable(fw.hostname)) {
        return fail_early(result, ErrorKind::Connection,
                          fmt::format("Host {} is not resolvable", fw.hostname));
    }

    auto secret = load_secret(platform::expand_user(fw.secret_file));
    if (secret.is_err()) {
        return fail_early(result, ErrorKind::Configuration, secret.error);
    }
    auto unusable = check_secret_value(secret.value);
    if (!unusable.empty()) {
        return fail_early(result, ErrorKind::Configuration,
                          fmt::format("{}: {}", fw.secret_file, unusable));
    }

    auto local = prepare_destination(fw, result.destination);
    if (local.is_err()) {
        return fail_early(result, ErrorKind::Configuration, local.error);
    }
    result.local_destination = local.value;

    // Declared before the controller: the channel writes into it until closed
    SessionLog transcript;
    transcript.add_secret(secret.value);
    transcript.add_secret(fw.password);
    if (result.local_destination) {
        fs::path log_path = fs::path(result.destination) / SESSION_LOG_NAME;
        if (!transcript.open(log_path)) {
            backup_log(fmt::format("[{}] cannot write {}", fw.name, log_path.string()));
        }
    }

    SshTarget target;
    target.host = fw.hostname;
    target.port = fw.port;
    target.user = fw.username;
    target.password = fw.password;
    if (!fw.ssh_key.empty()) {
        target.ssh_key_path = platform::expand_user(fw.ssh_key).string();
    }
    target.timeout = fw.conn_timeout;
    target.known_hosts = (platform::home_dir() / ".ssh" / "known_hosts").string();

    ChannelOpener opener = [&]() -> Result<std::unique_ptr<SessionChannel>> {
        auto channel = std::make_unique<SshChannel>(target);
        auto established = channel->establish(status);
        if (established.is_err()) {
            return Result<std::unique_ptr<SessionChannel>>::Err(established.error);
        }
        channel->set_transcript(&transcript);
        return Result<std::unique_ptr<SessionChannel>>::Ok(std::move(channel));
    };

    ControllerOptions options;
    options.label = fw.name;
    options.probe_timeout = seconds(fw.conn_timeout);
    options.transfer_timeout = seconds(fw.read_timeout);
    options.enable_level = fw.enable_level;
    options.cancel = cancel;
    if (fw.run_timeout > 0) {
        options.run_deadline = steady_clock::now() + seconds(fw.run_timeout);
    }

    BackupTarget backup_target;
    backup_target.backup_username = fw.backup_username;
    backup_target.secret = secret.value;
    backup_target.backup_host = fw.backup_host;
    backup_target.directory = result.destination;
    backup_target.run_date = local_date(now);

    transcript.note(fmt::format("backup of {} ({})", fw.name, fw.hostname));
    backup_log(fmt::format("[{}] starting backup of {} to {}", fw.name, fw.hostname, result.destination));

    SessionController controller(options, secret.value);
    BackupOrchestrator orchestrator(controller, status);
    try {
        result.report = orchestrator.run(backup_target, opener);
    } catch (const BackupError& e) {
        result.error = e.kind();
        result.message = redact(e.what(), transcript.secrets());
        backup_log(fmt::format("[{}] run aborted: {}", fw.name, result.message));
    }
    controller.close();

    if (result.report && fw.verify && result.local_destination) {
        result.verify = verify_destination(result.destination, *result.report);
    }
    return result;
}
