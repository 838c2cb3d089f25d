#include "backup_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <iostream>
#include <thread>
#include <fmt/format.h>

BackupCLI::BackupCLI(const std::atomic<bool>* cancel) : cancel_(cancel) {}

void BackupCLI::print_line(const std::string& text) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cout << text << std::flush;
}

bool BackupCLI::load_selection(const CliOptions& opts, Config& cfg,
                               std::vector<FirewallConfig>& selected) {
    // First start: leave a commented template behind instead of just failing
    if (!config_exists(opts.config_path)) {
        auto created = create_default_config(opts.config_path);
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
        } else {
            std::cout << theme::warn("No config found, wrote a default one to " + opts.config_path.string());
            std::cout << theme::step("Edit it and run again");
        }
        return false;
    }

    auto loaded = Config::load(opts.config_path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    cfg = loaded.value;

    auto chosen = select_firewalls(cfg, opts.firewalls);
    if (chosen.is_err()) {
        std::cout << theme::fail(chosen.error);
        std::string names;
        for (const auto& fw : cfg.firewalls()) names += (names.empty() ? "" : ", ") + fw.name;
        std::cout << theme::step("Configured: " + names);
        return false;
    }
    selected = chosen.value;
    return true;
}

// ── init ─────────────────────────────────────────────────────

int BackupCLI::run_init(const fs::path& config_path) {
    if (config_exists(config_path)) {
        std::cout << theme::info("Config already exists at " + config_path.string());
        return EXIT_ALL_OK;
    }
    auto created = create_default_config(config_path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return EXIT_USAGE;
    }
    std::cout << theme::ok("Created " + config_path.string() + " (mode 0600)");
    std::cout << theme::step(fmt::format("Edit it, then put the device secret into {} (chmod 600)",
                                         DEFAULT_SECRET_FILE));
    return EXIT_ALL_OK;
}

// ── check ────────────────────────────────────────────────────

int BackupCLI::run_check(const CliOptions& opts) {
    std::cout << theme::section("Preflight");

    auto file_issues = check_config_file(opts.config_path);
    bool fatal = std::any_of(file_issues.begin(), file_issues.end(),
                             [](const PreflightIssue& i) { return !i.is_hint; });
    for (const auto& issue : file_issues) {
        std::cout << (issue.is_hint ? theme::warn(issue.message) : theme::fail(issue.message));
        std::cout << theme::step(issue.fix);
    }
    if (fatal) return EXIT_USAGE;

    Config cfg;
    std::vector<FirewallConfig> selected;
    if (!load_selection(opts, cfg, selected)) return EXIT_USAGE;

    int errors = 0;
    for (const auto& fw : selected) {
        auto issues = check_firewall(fw);
        bool fw_ok = true;
        for (const auto& issue : issues) {
            if (issue.is_hint) {
                std::cout << theme::warn(issue.message);
            } else {
                std::cout << theme::fail(issue.message);
                fw_ok = false;
                ++errors;
            }
            std::cout << theme::step(issue.fix);
        }
        if (fw_ok) std::cout << theme::ok(fmt::format("{} ({})", fw.name, fw.hostname));
    }

    std::cout << "\n";
    return errors == 0 ? EXIT_ALL_OK : EXIT_USAGE;
}

// ── backup ───────────────────────────────────────────────────

void BackupCLI::print_result(const FirewallResult& result) {
    std::string out = theme::divider();
    out += theme::kv("Firewall name", result.name);
    out += theme::kv("Firewall host", result.hostname);
    out += theme::kv("Backup directory", result.destination);
    if (result.report) {
        out += theme::kv("Retention slot", result.report->suffix);
        out += theme::kv("Software version", result.report->facts.version.str());
        out += theme::kv("Context mode", context_mode_name(result.report->facts.mode));
    }
    out += "\n";

    if (result.error) {
        out += theme::fail(result.message);
    }
    if (result.report) {
        for (const auto& u : result.report->units) {
            std::string line = fmt::format("{:<28} {}", u.unit.describe(), u.unit.filename);
            switch (u.status) {
            case UnitStatus::Ok:
                out += theme::ok(line);
                break;
            case UnitStatus::Failed:
                out += theme::fail(line);
                out += theme::step(u.message);
                break;
            case UnitStatus::Skipped:
                out += theme::warn(line + " (" + u.message + ")");
                break;
            }
        }
    }
    if (result.verify) {
        for (const auto& a : result.verify->artifacts) {
            if (a.exists && a.size > 0) {
                out += theme::info(fmt::format("{:<40} {:>12} bytes", a.filename, a.size));
            }
        }
        for (const auto& w : result.verify->warnings) {
            out += theme::warn(w);
        }
    }
    print_line(out);
}

int BackupCLI::run_backup(const CliOptions& opts) {
    Config cfg;
    std::vector<FirewallConfig> selected;
    if (!load_selection(opts, cfg, selected)) return EXIT_USAGE;

    int workers = opts.jobs > 0 ? opts.jobs : cfg.parallel();
    workers = std::max(1, std::min<int>(workers, static_cast<int>(selected.size())));

    std::cout << theme::banner(APP_VERSION);
    std::cout << theme::kv("Started", now_display());
    std::cout << theme::kv("Firewalls", std::to_string(selected.size()));
    std::cout << theme::kv("Debug log", backup_log_path());
    backup_log(fmt::format("run started: {} firewall(s), {} worker(s)", selected.size(), workers));

    // Problems are reported up front; each pipeline still refuses to start on its own
    for (const auto& issue : run_preflight_checks(selected)) {
        std::cout << (issue.is_hint ? theme::info(issue.message) : theme::warn(issue.message));
    }

    // Every firewall is an independent pipeline; they share only the console
    std::vector<FirewallResult> results(selected.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        while (true) {
            size_t i = next++;
            if (i >= selected.size()) return;
            const auto& fw = selected[i];
            if (cancel_ && cancel_->load()) {
                results[i].name = fw.name;
                results[i].hostname = fw.hostname;
                results[i].destination = fw.backup_dir + "/" + fw.name;
                results[i].error = ErrorKind::Cancelled;
                results[i].message = "CancelledError: interrupted before start";
                continue;
            }
            print_line(theme::step(fmt::format("[{}] starting", fw.name)));
            results[i] = backup_firewall(fw, cancel_, [&, name = fw.name](const std::string& msg) {
                print_line(theme::step(fmt::format("[{}] {}", name, msg)));
            });
            print_line(results[i].success()
                ? theme::ok(fmt::format("[{}] done", fw.name))
                : theme::fail(fmt::format("[{}] finished with errors", fw.name)));
        }
    };

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        for (int w = 0; w < workers; ++w) pool.emplace_back(worker);
        for (auto& t : pool) t.join();
    }

    int failed = 0;
    for (const auto& r : results) {
        print_result(r);
        if (!r.success()) ++failed;
    }

    std::cout << theme::divider();
    if (failed == 0) {
        std::cout << theme::ok(fmt::format("All {} firewall(s) backed up", results.size()));
    } else {
        std::cout << theme::fail(fmt::format("{} of {} firewall(s) had errors", failed, results.size()));
    }
    backup_log(fmt::format("run finished: {} of {} with errors", failed, results.size()));
    return failed == 0 ? EXIT_ALL_OK : EXIT_SOME_FAILED;
}
