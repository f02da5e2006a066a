#include "cli.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "commands.h"
#include "config.h"
#include "daemon.h"
#include "lock.h"
#include "output.h"

static const char *RESTICD_VERSION = "0.1.0";

static void print_usage() {
    std::printf(
        "usage: resticd [--config PATH] [--verbose] [--dry-run] <command> [args]\n"
        "\n"
        "commands:\n"
        "  run NAME [--group G]... [--no-copy] [--location L]...\n"
        "  init NAME [--parent P] [RESTIC_ARGS...]\n"
        "  execute LOCATION [RESTIC_ARGS...]\n"
        "  command LOCATION\n"
        "  snapshots PROFILE [--json] [--location L]\n"
        "  apply PROFILE [--prune] [--location L]...\n"
        "  prune LOCATION\n"
        "  archive DESTINATION PROFILE [SNAPSHOT...] [--location L] [--encrypt] [--password FILE]\n"
        "  decrypt INPUT OUTPUT [--password FILE]\n"
        "  list\n"
        "  copy SOURCE DESTINATION SNAPSHOT...\n"
        "  mount PROFILE MOUNT [--location L]\n"
        "  daemon\n");
}

static bool env_flag(const char *name) {
    const char *value = getenv(name);
    if (!value) return false;
    std::string v = value;
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

static bool take_value(const std::vector<std::string> &args, size_t *i, std::string *out) {
    if (*i + 1 >= args.size()) {
        std::printf("%s requires a value\n", args[*i].c_str());
        return false;
    }
    *out = args[++*i];
    return true;
}

static bool expect_positionals(const std::string &command, const std::vector<std::string> &positional,
                               size_t min, size_t max) {
    if (positional.size() < min || positional.size() > max) {
        std::printf("%s: wrong number of arguments\n", command.c_str());
        print_usage();
        return false;
    }
    return true;
}

static void unknown_option(const std::string &command, const std::string &arg) {
    std::printf("%s: unknown option %s\n", command.c_str(), arg.c_str());
}

static bool is_option(const std::string &arg) {
    return arg.size() > 1 && arg[0] == '-';
}

static int dispatch(const std::string &command, const std::vector<std::string> &args, const Config &cfg,
                    const RunMode &mode) {
    std::vector<std::string> positional;

    if (command == "run") {
        RunOptions opts;
        for (size_t i = 0; i < args.size(); i++) {
            const std::string &arg = args[i];
            std::string value;
            if (arg == "--group" || arg == "-g") {
                if (!take_value(args, &i, &value)) return EXIT_USAGE;
                opts.groups.push_back(value);
            } else if (arg == "--location" || arg == "-l") {
                if (!take_value(args, &i, &value)) return EXIT_USAGE;
                opts.locations.push_back(value);
            } else if (arg == "--no-copy" || arg == "-N") {
                opts.no_copy = true;
            } else if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            } else {
                positional.push_back(arg);
            }
        }
        if (!expect_positionals(command, positional, 1, 1)) return EXIT_USAGE;
        opts.profile = positional[0];
        return cmd_run(cfg, mode, opts);
    }

    if (command == "init") {
        std::string parent;
        std::vector<std::string> extra;
        for (size_t i = 0; i < args.size(); i++) {
            const std::string &arg = args[i];
            if (arg == "--parent" || arg == "-p") {
                if (!take_value(args, &i, &parent)) return EXIT_USAGE;
            } else if (positional.empty() && !is_option(arg)) {
                positional.push_back(arg);
            } else {
                extra.push_back(arg);
            }
        }
        if (!expect_positionals(command, positional, 1, 1)) return EXIT_USAGE;
        return cmd_init(cfg, mode, positional[0], parent, extra);
    }

    if (command == "execute") {
        if (args.empty()) {
            expect_positionals(command, args, 1, 1);
            return EXIT_USAGE;
        }
        std::vector<std::string> rest(args.begin() + 1, args.end());
        return cmd_execute(cfg, mode, args[0], rest);
    }

    if (command == "command" || command == "prune") {
        for (const auto &arg : args) {
            if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            }
            positional.push_back(arg);
        }
        if (!expect_positionals(command, positional, 1, 1)) return EXIT_USAGE;
        if (command == "command") return cmd_command(cfg, positional[0]);
        return cmd_prune(cfg, mode, positional[0]);
    }

    if (command == "snapshots" || command == "mount") {
        std::string location;
        bool json = false;
        for (size_t i = 0; i < args.size(); i++) {
            const std::string &arg = args[i];
            if (arg == "--location" || arg == "-l") {
                if (!take_value(args, &i, &location)) return EXIT_USAGE;
            } else if (arg == "--json" && command == "snapshots") {
                json = true;
            } else if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            } else {
                positional.push_back(arg);
            }
        }
        if (command == "snapshots") {
            if (!expect_positionals(command, positional, 1, 1)) return EXIT_USAGE;
            return cmd_snapshots(cfg, mode, positional[0], json, location);
        }
        if (!expect_positionals(command, positional, 2, 2)) return EXIT_USAGE;
        return cmd_mount(cfg, mode, positional[0], positional[1], location);
    }

    if (command == "apply") {
        bool prune = false;
        std::vector<std::string> locations;
        for (size_t i = 0; i < args.size(); i++) {
            const std::string &arg = args[i];
            std::string value;
            if (arg == "--location" || arg == "-l") {
                if (!take_value(args, &i, &value)) return EXIT_USAGE;
                locations.push_back(value);
            } else if (arg == "--prune" || arg == "-p") {
                prune = true;
            } else if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            } else {
                positional.push_back(arg);
            }
        }
        if (!expect_positionals(command, positional, 1, 1)) return EXIT_USAGE;
        return cmd_apply(cfg, mode, positional[0], prune, locations);
    }

    if (command == "archive") {
        ArchiveOptions opts;
        for (size_t i = 0; i < args.size(); i++) {
            const std::string &arg = args[i];
            if (arg == "--location" || arg == "-l") {
                if (!take_value(args, &i, &opts.location)) return EXIT_USAGE;
            } else if (arg == "--password" || arg == "-p") {
                if (!take_value(args, &i, &opts.password_file)) return EXIT_USAGE;
            } else if (arg == "--encrypt" || arg == "-e") {
                opts.encrypt = true;
            } else if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.size() < 2) {
            expect_positionals(command, positional, 2, 2);
            return EXIT_USAGE;
        }
        opts.destination = positional[0];
        opts.profile = positional[1];
        opts.snapshots.assign(positional.begin() + 2, positional.end());
        return cmd_archive(cfg, mode, opts);
    }

    if (command == "decrypt") {
        std::string password;
        for (size_t i = 0; i < args.size(); i++) {
            const std::string &arg = args[i];
            if (arg == "--password" || arg == "-p") {
                if (!take_value(args, &i, &password)) return EXIT_USAGE;
            } else if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            } else {
                positional.push_back(arg);
            }
        }
        if (!expect_positionals(command, positional, 2, 2)) return EXIT_USAGE;
        return cmd_decrypt(cfg, positional[0], positional[1], password);
    }

    if (command == "copy") {
        for (const auto &arg : args) {
            if (is_option(arg)) {
                unknown_option(command, arg);
                return EXIT_USAGE;
            }
            positional.push_back(arg);
        }
        if (positional.size() < 3) {
            expect_positionals(command, positional, 3, 3);
            return EXIT_USAGE;
        }
        std::vector<std::string> snapshots(positional.begin() + 2, positional.end());
        return cmd_copy(cfg, mode, positional[0], positional[1], snapshots);
    }

    if (command == "list") {
        if (!expect_positionals(command, args, 0, 0)) return EXIT_USAGE;
        return cmd_list(cfg);
    }

    if (command == "daemon") {
        if (!expect_positionals(command, args, 0, 0)) return EXIT_USAGE;
        return cmd_daemon(cfg, mode);
    }

    std::printf("unknown command %s\n", command.c_str());
    print_usage();
    return EXIT_USAGE;
}

static bool command_takes_lock(const std::string &command) {
    return command == "run" || command == "daemon";
}

int run_cli(const std::vector<std::string> &argv) {
    RunMode mode;
    std::string config_path = default_config_path();
    std::string command;
    std::vector<std::string> command_args;

    mode.verbose = env_flag("RESTICD_VERBOSE");
    mode.dry_run = env_flag("RESTICD_DRY_RUN");

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string &arg = argv[i];
        if (!command.empty()) {
            command_args.push_back(arg);
            continue;
        }
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argv.size()) {
                std::printf("--config requires a path\n");
                return EXIT_USAGE;
            }
            config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            mode.verbose = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            mode.dry_run = true;
        } else if (arg == "--version") {
            std::printf("resticd %s\n", RESTICD_VERSION);
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (is_option(arg)) {
            std::printf("unknown option %s\n", arg.c_str());
            return EXIT_USAGE;
        } else {
            command = arg;
        }
    }
    if (command.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    Config cfg;
    std::string err;
    if (!parse_config(config_path, &cfg, &err)) {
        print_error("failed to load config " + config_path + ": " + err);
        return EXIT_USAGE;
    }
    if (cfg.profiles.empty()) {
        print_error("Error: no profiles defined in config");
        return EXIT_USAGE;
    }
    if (mode.dry_run) {
        print_warning("Executing as a dry-run. This may not be supported by all commands.");
    }

    bool have_lock = false;
    if (!cfg.lock_file.empty() && command_takes_lock(command) && !mode.dry_run) {
        int lock_rc = lock_file(cfg.lock_file);
        if (lock_rc == 0) {
            print_error("resticd is already running (lock " + cfg.lock_file + ")");
            return EXIT_LOCKED;
        }
        if (lock_rc < 0) {
            print_error("failed to lock " + cfg.lock_file + ": " + std::strerror(errno));
            return EXIT_USAGE;
        }
        have_lock = true;
    }

    int rc = dispatch(command, command_args, cfg, mode);

    if (have_lock) unlock_file(cfg.lock_file);
    return rc;
}
