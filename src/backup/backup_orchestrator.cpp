#include "backup_orchestrator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>

std::string build_destination_url(const BackupTarget& target) {
    return fmt::format(BACKUP_URL, target.backup_username, target.secret,
                       target.backup_host, target.directory);
}

// Units of one failover role. `tag` is the suffix, wrapped for standby.
static void plan_role(const DeviceFacts& facts, const std::string& tag, FailoverRole role,
                      std::vector<BackupUnit>& units) {
    units.push_back({UnitKind::TechSupport, std::nullopt, "",
                     fmt::format(TECH_SUPPORT_FILE, tag), role});

    if (!facts.supports_native_backup()) {
        units.push_back({UnitKind::LegacyConfig, std::nullopt, "running-config",
                         fmt::format(RUNNING_CONFIG_FILE, tag), role});
        units.push_back({UnitKind::LegacyConfig, std::nullopt, "startup-config",
                         fmt::format(STARTUP_CONFIG_FILE, tag), role});
        for (const auto& ctx : facts.contexts) {
            if (ctx == SYSTEM_CONTEXT) continue;
            units.push_back({UnitKind::ContextConfig, ctx, "",
                             fmt::format(CONTEXT_CONFIG_FILE, ctx, tag), role});
        }
        return;
    }

    if (facts.mode == ContextMode::Single) {
        units.push_back({UnitKind::BackupArchive, std::nullopt, "",
                         fmt::format(BACKUP_FILE, tag), role});
        return;
    }

    for (const auto& ctx : facts.contexts) {
        units.push_back({UnitKind::BackupArchive, ctx, "",
                         fmt::format(CONTEXT_BACKUP_FILE, ctx, tag), role});
    }
}

std::vector<BackupUnit> plan_units(const DeviceFacts& facts, const std::string& suffix) {
    std::vector<BackupUnit> units;
    plan_role(facts, suffix, FailoverRole::Active, units);
    if (facts.failover) {
        plan_role(facts, fmt::format(STANDBY_TAG, suffix), FailoverRole::Standby, units);
    }
    return units;
}

std::string unit_status_name(UnitStatus status) {
    switch (status) {
    case UnitStatus::Ok:      return "ok";
    case UnitStatus::Failed:  return "failed";
    case UnitStatus::Skipped: return "skipped";
    }
    return "unknown";
}

bool RunReport::all_ok() const {
    return std::all_of(units.begin(), units.end(),
                       [](const UnitOutcome& u) { return u.status == UnitStatus::Ok; });
}

size_t RunReport::count(UnitStatus status) const {
    return std::count_if(units.begin(), units.end(),
                         [status](const UnitOutcome& u) { return u.status == status; });
}

// ── BackupOrchestrator ───────────────────────────────────────

BackupOrchestrator::BackupOrchestrator(SessionController& controller, StatusCallback status)
    : controller_(controller), status_(std::move(status)) {}

void BackupOrchestrator::notify(const std::string& msg) const {
    if (status_) status_(msg);
}

RunReport BackupOrchestrator::run(const BackupTarget& target, const ChannelOpener& opener) {
    RunReport report;
    // One slot for the whole run, even if it crosses midnight
    report.suffix = retention_suffix(target.run_date);
    std::string url = build_destination_url(target);

    notify("Connecting...");
    controller_.connect(opener);
    notify("Entering privileged mode...");
    controller_.elevate();
    notify("Probing device...");
    report.facts = controller_.probe();

    notify(fmt::format("Version {}, {} context mode", report.facts.version.str(),
                       context_mode_name(report.facts.mode)));

    std::optional<ErrorKind> fatal;
    for (const auto& unit : plan_units(report.facts, report.suffix)) {
        UnitOutcome outcome;
        outcome.unit = unit;

        if (fatal) {
            outcome.status = UnitStatus::Skipped;
            outcome.error = *fatal;
            outcome.message = fmt::format("skipped after {}", error_kind_name(*fatal));
            report.units.push_back(outcome);
            continue;
        }

        notify(fmt::format("Backing up {} -> {}", unit.describe(), unit.filename));
        try {
            controller_.run_unit(unit, url, report.facts);
        } catch (const BackupError& e) {
            outcome.status = UnitStatus::Failed;
            outcome.error = e.kind();
            outcome.message = e.what();
            outcome.command = e.command();
            backup_log(fmt::format("unit {} failed: {}", unit.describe(), e.what()));
            if (is_session_fatal(e.kind())) fatal = e.kind();
        }
        report.units.push_back(outcome);
    }

    controller_.close();
    return report;
}
