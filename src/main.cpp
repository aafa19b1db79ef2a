// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include "conf/config.hpp"
#include "core/events.hpp"
#include "core/fstab.hpp"
#include "core/remediator.hpp"
#include "core/runner.hpp"
#include "core/state.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace ntfsmh;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path fstab;
    fs::path log_file;
    std::string output;
    bool verbose = false;
    bool no_delay = false;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: ntfs-mount-helper [OPTIONS] [command]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run                Check, repair and remount NTFS volumes (default)\n";
    std::cout << "  check              Report NTFS volume status without changing anything\n";
    std::cout << "  status             Show the time of the last run\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show effective configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path (default " << DEFAULT_CONFIG_FILE
              << ")\n";
    std::cout << "  -f, --fstab FILE        Mount table to read\n";
    std::cout << "  -l, --log FILE          Log file\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -n, --no-delay          Skip all settle delays\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  ntfs-mount-helper                      # Repair and remount\n";
    std::cout << "  ntfs-mount-helper -n check             # Dry inspection\n";
    std::cout << "  ntfs-mount-helper config gen -o /etc/ntfs-mount-helper.conf\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"fstab", required_argument, 0, 'f'},
                                           {"log", required_argument, 0, 'l'},
                                           {"output", required_argument, 0, 'o'},
                                           {"no-delay", no_argument, 0, 'n'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:f:l:o:nvh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'f':
            opts.fstab = optarg;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'n':
            opts.no_delay = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    Config config = opts.config_file.empty() ? Config::load_default()
                                             : Config::from_file(opts.config_file);
    config.merge_with_cli(opts.fstab, opts.log_file, opts.verbose, opts.no_delay);
    return config;
}

static void show_config(const Config& config) {
    std::cout << "{\n";
    std::cout << "  \"fstab\": \"" << config.fstab.string() << "\",\n";
    std::cout << "  \"log_file\": \"" << config.log_file.string() << "\",\n";
    std::cout << "  \"lastrun_file\": \"" << config.lastrun_file.string() << "\",\n";
    std::cout << "  \"repair_command\": \"" << config.repair_command << "\",\n";
    std::cout << "  \"repair_args\": [";
    for (size_t i = 0; i < config.repair_args.size(); ++i) {
        std::cout << "\"" << config.repair_args[i] << "\"";
        if (i < config.repair_args.size() - 1)
            std::cout << ", ";
    }
    std::cout << "],\n";
    std::cout << "  \"dmesg_lines\": " << config.dmesg_lines << ",\n";
    std::cout << "  \"startup_delay\": " << config.startup_delay << ",\n";
    std::cout << "  \"umount_settle\": " << config.umount_settle << ",\n";
    std::cout << "  \"repair_settle\": " << config.repair_settle << ",\n";
    std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << "\n";
    std::cout << "}\n";
}

// Inspection only: nothing is unmounted, repaired or written.
static int check_volumes(const Config& config) {
    ProcessRunner runner;
    LoggerSink sink;
    Remediator remediator(config, runner, sink);

    std::vector<FstabEntry> entries = select_ntfs(load_fstab(config.fstab));
    if (entries.empty()) {
        std::cout << "No NTFS entries in " << config.fstab.string() << "\n";
        return 0;
    }

    for (const auto& entry : entries) {
        EntryStatus status = remediator.inspect(entry);
        std::cout << entry.device_spec << " (" << status.device << ") -> " << entry.mount_point
                  << ": " << volume_state_name(status.state);
        if (status.needs_repair()) {
            std::cout << " [would repair]";
        }
        std::cout << "\n";
        for (const auto& line : status.health.matches) {
            std::cout << "    " << line << "\n";
        }
    }
    return 0;
}

static int run_remediation(const Config& config) {
    try {
        ProcessRunner runner;
        LoggerSink sink;
        Remediator remediator(config, runner, sink);
        remediator.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error during run: " + std::string(e.what()));
        if (!LastRunMarker::now().save(config.lastrun_file)) {
            LOG_ERROR("Could not update last-run marker " + config.lastrun_file.string());
        }
    }
    // Failures are reported in the log only
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        // Console-only logger until the config names the log file
        Logger::getInstance().init(cli.verbose, fs::path());

        enum class Command { RUN, CHECK, STATUS, CONFIG, UNKNOWN };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd.empty() || cmd == "run")
                return Command::RUN;
            if (cmd == "check")
                return Command::CHECK;
            if (cmd == "status")
                return Command::STATUS;
            if (cmd == "config")
                return Command::CONFIG;
            return Command::UNKNOWN;
        };

        switch (get_command(cli.command)) {
        case Command::CONFIG: {
            if (cli.args.empty()) {
                std::cerr << "Usage: ntfs-mount-helper config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? "ntfs-mount-helper.conf" : cli.output;
                if (!Config().save_to_file(output)) {
                    std::cerr << "Failed to write config: " << output << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output << "\n";
                return 0;
            } else if (subcmd == "show") {
                show_config(load_config(cli));
                return 0;
            } else {
                std::cerr << "Unknown config subcommand: " << subcmd << "\n";
                std::cerr << "Available: gen, show\n";
                return 1;
            }
        }

        case Command::STATUS: {
            Config config = load_config(cli);
            LastRunMarker marker = load_lastrun_marker(config.lastrun_file);
            if (marker.timestamp.empty()) {
                std::cout << "No previous run recorded in " << config.lastrun_file.string()
                          << "\n";
            } else {
                std::cout << "Last run: " << marker.timestamp << "\n";
            }
            return 0;
        }

        case Command::CHECK:
            return check_volumes(load_config(cli));

        case Command::RUN:
            // Fall through to remediation below
            break;

        case Command::UNKNOWN:
        default:
            std::cerr << "Unknown command: " << cli.command << "\n";
            print_help();
            return 1;
        }

        Config config = load_config(cli);

        // Re-initialize logger with merged config
        Logger::getInstance().init(config.verbose, config.log_file);

        return run_remediation(config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
}
