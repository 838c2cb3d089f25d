#include <iostream>
#include <vector>
#include <string>
#include <atomic>
#include <csignal>
#include "cli/backup_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/ssh_channel.hpp>

static std::atomic<bool> g_cancel{false};

static void on_signal(int) {
    g_cancel.store(true);
}

void print_usage() {
    std::cout << theme::banner(APP_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    asabackup "
              << theme::color::RESET << theme::color::SLATE << "[-c FILE] [-j N] [-f NAME... | all]"
              << theme::color::RESET << "\n"
              << theme::color::DIM
              << "                          Back up the selected firewalls (default: all)"
              << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    asabackup check "
              << theme::color::RESET << theme::color::SLATE << "[-c FILE] [-f NAME...]"
              << theme::color::RESET << theme::color::DIM
              << "   Preflight checks only" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    asabackup init "
              << theme::color::RESET << theme::color::SLATE << "[-c FILE]"
              << theme::color::RESET << theme::color::DIM
              << "                Write a default config" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    -c, --config FILE     Config file (default " << CONFIG_FILE << ")\n"
              << "    -j, --jobs N          Firewalls backed up concurrently\n"
              << "    -f, --firewalls NAME  Firewalls to back up, or 'all'\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

// Returns false on a usage error.
static bool parse_args(int argc, char** argv, int first, CliOptions& opts) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cout << theme::fail(arg + " needs a file name");
                return false;
            }
            opts.config_path = platform::expand_user(argv[++i]);
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= argc || safe_stoi(argv[i + 1], 0) <= 0) {
                std::cout << theme::fail(arg + " needs a positive number");
                return false;
            }
            opts.jobs = safe_stoi(argv[++i], 1);
        } else if (arg == "-f" || arg == "--firewalls") {
            // Names until the next option
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                opts.firewalls.push_back(argv[++i]);
            }
            if (opts.firewalls.empty()) {
                std::cout << theme::fail(arg + " needs at least one name (or 'all')");
                return false;
            }
        } else {
            std::cout << theme::fail("Unknown argument: " + arg);
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        std::string cmd = argc >= 2 ? argv[1] : "";

        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "asabackup"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << APP_VERSION << theme::color::RESET << "\n";
            return EXIT_ALL_OK;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return EXIT_ALL_OK;
        }

        CliOptions opts;
        opts.config_path = get_config_path();

        int first = (cmd == "check" || cmd == "init") ? 2 : 1;
        if (!parse_args(argc, argv, first, opts)) {
            print_usage();
            return EXIT_USAGE;
        }

        BackupCLI cli(&g_cancel);
        if (cmd == "init") {
            return cli.run_init(opts.config_path);
        }
        if (cmd == "check") {
            return cli.run_check(opts);
        }

        auto init = SshChannel::global_init();
        if (init.is_err()) {
            std::cout << theme::fail(init.error);
            return EXIT_SOME_FAILED;
        }
        int rc = cli.run_backup(opts);
        SshChannel::global_shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_SOME_FAILED;
    }
}
