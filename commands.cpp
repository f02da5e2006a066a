#include "commands.h"

#include "process.h"
#include "restic_args.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <sys/stat.h>

static int fail(const std::string &err) {
    print_error("Error: " + err);
    return EXIT_FAILED;
}

static int stopped() {
    return fail("stop requested, not starting further restic commands");
}

static std::vector<std::string> restic_argv(const Config &cfg, const std::vector<std::string> &args) {
    std::vector<std::string> argv = {cfg.restic};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

static int run_restic(const Config &cfg, const RunMode &mode, const std::vector<std::string> &args,
                      const Environment &env, const CommandOptions &base, std::string *output = nullptr) {
    std::vector<std::string> argv = restic_argv(cfg, args);
    if (mode.verbose) {
        print_line("Restic command:");
        std::printf("%s\n", shell_join(argv).c_str());
    }
    CommandOptions opts = base;
    opts.env = &env;
    int rc = run_command(argv, opts, output);
    if (rc < 0) {
        print_error("Error: failed to start " + cfg.restic);
    }
    return rc;
}

// Runs restic attached to the terminal and passes its exit code through.
static int run_foreground(const Config &cfg, const RunMode &mode, const std::vector<std::string> &args,
                          const Environment &env) {
    CommandOptions opts;
    int rc = run_restic(cfg, mode, args, env, opts);
    return rc < 0 ? EXIT_FAILED : rc;
}

static int run_polite(const Config &cfg, const RunMode &mode, const std::vector<std::string> &args,
                      const Environment &env) {
    CommandOptions opts;
    opts.polite = true;
    return run_restic(cfg, mode, args, env, opts);
}

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool parse_snapshot_id(const std::string &output, std::string *id) {
    static const std::string prefix = "snapshot ";
    static const std::string suffix = " saved";
    size_t pos = 0;
    while ((pos = output.find(prefix, pos)) != std::string::npos) {
        size_t start = pos + prefix.size();
        size_t end = start;
        while (end < output.size() && is_word_char(output[end])) end++;
        if (end > start && output.compare(end, suffix.size(), suffix) == 0) {
            *id = output.substr(start, end - start);
            return true;
        }
        pos = start;
    }
    return false;
}

static bool profile_locations(const Config &cfg, const std::string &profile_name, const Policy **policy,
                              std::string *err) {
    *policy = profile_policy(cfg, profile_name, err);
    return *policy != nullptr;
}

static std::string join_names(const std::vector<std::string> &names) {
    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

// Shared by `apply` and profiles with auto_apply.
static int apply_policy(const Config &cfg, const RunMode &mode, const Profile &profile, const Policy &policy,
                        bool prune, const std::vector<std::string> &locations) {
    std::vector<std::string> retention;
    std::string err;
    if (!retention_arguments(policy, &retention, &err)) {
        return fail(err);
    }
    int result = 0;
    for (const auto &location : locations) {
        if (stop_requested()) return stopped();
        print_line("Applying policy to '" + location + "'...");
        std::vector<std::string> args;
        Environment env;
        if (!location_arguments(cfg, location, false, &args, &err) ||
            !execution_environment(cfg, location, &env, &err)) {
            result = fail(err);
            continue;
        }
        args.push_back("forget");
        // Grouping would split the policy by path and host.
        args.push_back("--group-by");
        args.push_back("");
        std::vector<std::string> tags = tag_arguments(cfg, profile);
        args.insert(args.end(), tags.begin(), tags.end());
        args.insert(args.end(), retention.begin(), retention.end());
        if (mode.dry_run) args.push_back("--dry-run");
        if (prune) args.push_back("--prune");

        int rc = run_polite(cfg, mode, args, env);
        if (rc != 0) {
            print_error("Error: forget on '" + location + "' failed with exit code " + std::to_string(rc));
            result = EXIT_FAILED;
        }
    }
    return result;
}

static int backup_to(const Config &cfg, const RunMode &mode, const RunOptions &opts, const Profile &profile,
                     const std::string &location, std::string *snapshot) {
    std::string err;
    std::vector<std::string> args;
    Environment env;
    if (!location_arguments(cfg, location, false, &args, &err) ||
        !execution_environment(cfg, location, &env, &err)) {
        return fail(err);
    }
    args.push_back("backup");
    std::vector<std::string> host = hostname_arguments(profile);
    args.insert(args.end(), host.begin(), host.end());
    std::vector<std::string> tags = tag_arguments(cfg, profile);
    args.insert(args.end(), tags.begin(), tags.end());
    if (!inclusion_arguments(cfg, profile, opts.groups, &args, &err)) {
        return fail("profile '" + opts.profile + "': " + err);
    }
    args.insert(args.end(), profile.args.begin(), profile.args.end());
    if (mode.dry_run) args.push_back("--dry-run");

    print_line("Executing backup to '" + location + "'...");
    CommandOptions copts;
    copts.polite = true;
    copts.output = OutputMode::Tee;
    std::string output;
    int rc = run_restic(cfg, mode, args, env, copts, &output);
    if (rc == RESTIC_INCOMPLETE) {
        print_warning("Warning: backup to '" + location + "' is incomplete, some source files could not be read");
    } else if (rc != 0) {
        return fail("backup to '" + location + "' failed with exit code " + std::to_string(rc));
    }
    if (mode.dry_run) return 0;
    if (!parse_snapshot_id(output, snapshot)) {
        return fail("unable to parse the saved snapshot");
    }
    print_nested_line("Saved snapshot " + *snapshot);
    return 0;
}

static int copy_to_secondaries(const Config &cfg, const RunMode &mode, const std::string &primary,
                               const std::vector<std::string> &secondaries, const std::string &snapshot) {
    std::string err;
    std::vector<std::string> source_args;
    Environment source_env;
    if (!location_arguments(cfg, primary, true, &source_args, &err) ||
        !execution_environment(cfg, primary, &source_env, &err)) {
        return fail(err);
    }
    print_line("Copying snapshot to secondary locations");
    int result = 0;
    for (const auto &secondary : secondaries) {
        if (stop_requested()) return stopped();
        print_nested_line("Copying to '" + secondary + "'...");
        std::vector<std::string> args;
        Environment env = source_env;
        Environment dest_env;
        if (!location_arguments(cfg, secondary, false, &args, &err) ||
            !execution_environment(cfg, secondary, &dest_env, &err)) {
            result = fail(err);
            continue;
        }
        for (const auto &kv : dest_env) env[kv.first] = kv.second;
        args.push_back("copy");
        args.insert(args.end(), source_args.begin(), source_args.end());
        args.push_back(snapshot);
        int rc = run_polite(cfg, mode, args, env);
        if (rc != 0) {
            print_error("Error: copy to '" + secondary + "' failed with exit code " + std::to_string(rc));
            result = EXIT_FAILED;
        }
    }
    return result;
}

int cmd_run(const Config &cfg, const RunMode &mode, const RunOptions &opts) {
    std::string err;
    const Profile *profile = find_profile(cfg, opts.profile, &err);
    if (!profile) return fail(err);
    const Policy *policy = nullptr;
    if (!profile_locations(cfg, opts.profile, &policy, &err)) return fail(err);

    bool overridden = !opts.locations.empty();
    const std::vector<std::string> &locations = overridden ? opts.locations : policy->locations;
    bool no_copy = opts.no_copy || overridden;

    print_line("Starting at " + format_time(std::time(nullptr)));
    print_line("Chosen profile: " + opts.profile);
    if (overridden) {
        print_line("Selected locations: " + join_names(locations));
    } else {
        print_line("Primary location: " + locations[0]);
        if (locations.size() > 1) {
            std::vector<std::string> rest(locations.begin() + 1, locations.end());
            print_line("Secondary locations: " + join_names(rest));
        }
    }

    // With an override every named location receives its own backup.
    std::vector<std::string> targets;
    if (overridden) {
        targets = locations;
    } else {
        targets.push_back(locations[0]);
    }
    int result = 0;
    std::string primary_snapshot;
    for (const auto &target : targets) {
        if (stop_requested()) return stopped();
        std::string snapshot;
        int rc = backup_to(cfg, mode, opts, *profile, target, &snapshot);
        if (rc != 0) {
            result = rc;
            continue;
        }
        if (primary_snapshot.empty()) primary_snapshot = snapshot;
    }
    if (result != 0) return result;

    if (mode.dry_run) {
        print_line("Dry run complete");
        return 0;
    }

    if (!no_copy && locations.size() > 1) {
        std::vector<std::string> secondaries(locations.begin() + 1, locations.end());
        result = copy_to_secondaries(cfg, mode, locations[0], secondaries, primary_snapshot);
    }

    if (stop_requested()) return stopped();
    if (profile->auto_apply) {
        int rc = apply_policy(cfg, mode, *profile, *policy, false, locations);
        if (rc != 0) result = rc;
    }

    print_line("Finished at " + format_time(std::time(nullptr)));
    return result;
}

int cmd_init(const Config &cfg, const RunMode &mode, const std::string &location, const std::string &parent,
             const std::vector<std::string> &extra_args) {
    std::string err;
    std::vector<std::string> args;
    Environment env;
    if (!location_arguments(cfg, location, false, &args, &err) ||
        !execution_environment(cfg, location, &env, &err)) {
        return fail(err);
    }
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    args.push_back("init");

    if (!parent.empty()) {
        Environment parent_env;
        if (!validate_two_repo_operation(cfg, location, parent, &err) ||
            !execution_environment(cfg, parent, &parent_env, &err) ||
            !location_arguments(cfg, parent, true, &args, &err)) {
            return fail(err);
        }
        for (const auto &kv : parent_env) {
            if (env.find(kv.first) == env.end()) env[kv.first] = kv.second;
        }
        args.push_back("--copy-chunker-params");
    }
    return run_foreground(cfg, mode, args, env);
}

int cmd_execute(const Config &cfg, const RunMode &mode, const std::string &location,
                const std::vector<std::string> &extra_args) {
    std::string err;
    std::vector<std::string> args;
    Environment env;
    if (!location_arguments(cfg, location, false, &args, &err) ||
        !execution_environment(cfg, location, &env, &err)) {
        return fail(err);
    }
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    return run_foreground(cfg, mode, args, env);
}

int cmd_command(const Config &cfg, const std::string &location) {
    std::string err;
    const Location *loc = find_location(cfg, location, &err);
    if (!loc) return fail(err);
    std::vector<std::string> args;
    if (!location_arguments(cfg, location, false, &args, &err)) return fail(err);

    std::vector<std::string> argv;
    const Environment &overrides = loc->has_clean_env ? loc->clean_env : loc->env;
    if (loc->has_clean_env || !overrides.empty()) {
        argv.push_back("env");
        if (loc->has_clean_env) argv.push_back("-i");
        for (const auto &kv : overrides) {
            argv.push_back(kv.first + "=" + kv.second);
        }
    }
    argv.push_back(cfg.restic);
    argv.insert(argv.end(), args.begin(), args.end());
    std::printf("%s\n", shell_join(argv).c_str());
    return 0;
}

int cmd_snapshots(const Config &cfg, const RunMode &mode, const std::string &profile_name, bool json,
                  const std::string &location) {
    std::string err;
    const Profile *profile = find_profile(cfg, profile_name, &err);
    if (!profile) return fail(err);
    const Policy *policy = nullptr;
    if (!profile_locations(cfg, profile_name, &policy, &err)) return fail(err);
    std::string target = location.empty() ? policy->locations[0] : location;

    std::vector<std::string> args;
    Environment env;
    if (!location_arguments(cfg, target, false, &args, &err) ||
        !execution_environment(cfg, target, &env, &err)) {
        return fail(err);
    }
    args.push_back("snapshots");
    std::vector<std::string> tags = tag_arguments(cfg, *profile);
    args.insert(args.end(), tags.begin(), tags.end());
    if (json) args.push_back("--json");
    return run_foreground(cfg, mode, args, env);
}

int cmd_apply(const Config &cfg, const RunMode &mode, const std::string &profile_name, bool prune,
              const std::vector<std::string> &locations) {
    std::string err;
    const Profile *profile = find_profile(cfg, profile_name, &err);
    if (!profile) return fail(err);
    const Policy *policy = nullptr;
    if (!profile_locations(cfg, profile_name, &policy, &err)) return fail(err);
    return apply_policy(cfg, mode, *profile, *policy, prune, locations.empty() ? policy->locations : locations);
}

int cmd_prune(const Config &cfg, const RunMode &mode, const std::string &location) {
    std::string err;
    std::vector<std::string> args;
    Environment env;
    if (!location_arguments(cfg, location, false, &args, &err) ||
        !execution_environment(cfg, location, &env, &err)) {
        return fail(err);
    }
    args.push_back("prune");
    int rc = run_polite(cfg, mode, args, env);
    if (rc != 0) {
        return fail("prune on '" + location + "' failed with exit code " + std::to_string(rc));
    }
    return 0;
}

int cmd_list(const Config &cfg) {
    std::printf("Locations:\n");
    for (const auto &entry : cfg.locations) {
        std::printf("  - %s (%s)\n", entry.first.c_str(), entry.second.path.c_str());
    }
    std::printf("\nPolicies:\n");
    for (const auto &entry : cfg.policies) {
        const Policy &policy = entry.second;
        std::printf("  - %s: %s", entry.first.c_str(), join_names(policy.locations).c_str());
        if (!policy.schedule.empty()) {
            std::printf(" [%s]", policy.schedule.c_str());
        }
        std::printf("\n");
    }
    std::printf("\nProfiles:\n");
    if (cfg.has_global_profile) {
        std::printf("  - global_profile\n");
    }
    for (const auto &entry : cfg.profiles) {
        const Profile &profile = entry.second;
        std::printf("  - %s", entry.first.c_str());
        if (!profile.policy.empty()) {
            std::printf(" (policy %s)", profile.policy.c_str());
        }
        std::printf("\n");
    }
    return 0;
}

int cmd_copy(const Config &cfg, const RunMode &mode, const std::string &source, const std::string &destination,
             const std::vector<std::string> &snapshots) {
    std::string err;
    if (snapshots.empty()) return fail("at least one snapshot is required");
    if (!validate_two_repo_operation(cfg, source, destination, &err)) return fail(err);

    std::vector<std::string> source_args;
    std::vector<std::string> args;
    Environment env;
    Environment dest_env;
    if (!location_arguments(cfg, source, true, &source_args, &err) ||
        !location_arguments(cfg, destination, false, &args, &err) ||
        !execution_environment(cfg, source, &env, &err) ||
        !execution_environment(cfg, destination, &dest_env, &err)) {
        return fail(err);
    }
    for (const auto &kv : dest_env) env[kv.first] = kv.second;
    args.push_back("copy");
    args.insert(args.end(), source_args.begin(), source_args.end());
    args.insert(args.end(), snapshots.begin(), snapshots.end());
    return run_foreground(cfg, mode, args, env);
}

int cmd_mount(const Config &cfg, const RunMode &mode, const std::string &profile_name, const std::string &mount_point,
              const std::string &location) {
    std::string err;
    struct stat st;
    if (stat(mount_point.c_str(), &st) != 0) {
        return fail("mount point " + mount_point + " does not exist");
    }
    const Profile *profile = find_profile(cfg, profile_name, &err);
    if (!profile) return fail(err);
    print_line("Backup profile: " + profile_name);
    const Policy *policy = nullptr;
    if (!profile_locations(cfg, profile_name, &policy, &err)) return fail(err);
    print_line("Backup policy: " + profile->policy);
    std::string target = location.empty() ? policy->locations[0] : location;
    print_line("Backup location: " + target);

    std::vector<std::string> args;
    Environment env;
    if (!location_arguments(cfg, target, false, &args, &err) ||
        !execution_environment(cfg, target, &env, &err)) {
        return fail(err);
    }
    args.push_back("mount");
    std::vector<std::string> tags = tag_arguments(cfg, *profile);
    args.insert(args.end(), tags.begin(), tags.end());
    args.push_back(mount_point);

    print_line("Mounting...");
    return run_foreground(cfg, mode, args, env);
}
