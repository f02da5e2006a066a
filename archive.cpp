#include "commands.h"

#include "process.h"
#include "restic_args.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <json/json.h>
#include <memory>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

struct SnapshotInfo {
    std::string id;
    std::string short_id;
    std::string time;
};

static int fail(const std::string &err) {
    print_error("Error: " + err);
    return EXIT_FAILED;
}

static bool parse_json(const std::string &text, Json::Value *root, std::string *err) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), root, &errors)) {
        *err = "invalid JSON from restic: " + errors;
        return false;
    }
    return true;
}

bool archive_timestamp(const std::string &restic_time, std::string *out) {
    // Only the wall clock part is used, in the offset restic reported.
    static const char *layout = "dddd-dd-ddTdd:dd:dd";
    size_t len = std::strlen(layout);
    if (restic_time.size() < len) return false;
    std::string digits;
    for (size_t i = 0; i < len; i++) {
        char c = restic_time[i];
        if (layout[i] == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            digits += c;
        } else if (c != layout[i]) {
            return false;
        }
    }
    *out = digits;
    return true;
}

static bool path_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static bool free_bytes(const std::string &dir, uint64_t *out, std::string *err) {
    struct statvfs vfs;
    if (statvfs(dir.c_str(), &vfs) != 0) {
        *err = "statvfs " + dir + ": " + std::strerror(errno);
        return false;
    }
    *out = static_cast<uint64_t>(vfs.f_bavail) * static_cast<uint64_t>(vfs.f_frsize);
    return true;
}

static std::vector<std::string> openssl_args(const std::string &password_path, bool decrypt) {
    return {"openssl", "enc", "-aes-256-cbc", "-md", "sha512", "-pbkdf2", "-iter", "100000",
            "-pass", "file:" + password_path, decrypt ? "-d" : "-e"};
}

static bool query_snapshot(const Config &cfg, const std::vector<std::string> &location_args, const Environment &env,
                           const std::string &name, SnapshotInfo *info, std::string *err) {
    std::vector<std::string> argv = {cfg.restic};
    argv.insert(argv.end(), location_args.begin(), location_args.end());
    argv.push_back("--quiet");
    argv.push_back("snapshots");
    argv.push_back(name);
    argv.push_back("--json");
    CommandOptions opts;
    opts.env = &env;
    opts.output = OutputMode::Capture;
    std::string output;
    int rc = run_command(argv, opts, &output);
    if (rc != 0) {
        *err = "querying snapshots failed with exit code " + std::to_string(rc);
        return false;
    }
    Json::Value root;
    if (!parse_json(output, &root, err)) return false;
    if (!root.isArray() || root.empty() || !root[0].isObject()) {
        *err = "could not find snapshot '" + name + "'";
        return false;
    }
    const Json::Value &snap = root[0];
    info->id = snap.get("id", "").asString();
    info->short_id = snap.get("short_id", "").asString();
    info->time = snap.get("time", "").asString();
    if (info->id.empty()) {
        *err = "snapshot '" + name + "' has no id";
        return false;
    }
    if (info->short_id.empty()) info->short_id = info->id.substr(0, 8);
    return true;
}

static bool query_snapshot_size(const Config &cfg, const std::vector<std::string> &location_args,
                                const Environment &env, const std::string &id, uint64_t *size, std::string *err) {
    std::vector<std::string> argv = {cfg.restic};
    argv.insert(argv.end(), location_args.begin(), location_args.end());
    argv.push_back("--quiet");
    argv.push_back("stats");
    argv.push_back(id);
    argv.push_back("--json");
    CommandOptions opts;
    opts.env = &env;
    opts.output = OutputMode::Capture;
    std::string output;
    int rc = run_command(argv, opts, &output);
    if (rc != 0) {
        *err = "querying snapshot statistics failed with exit code " + std::to_string(rc);
        return false;
    }
    Json::Value root;
    if (!parse_json(output, &root, err)) return false;
    if (!root.isObject() || !root["total_size"].isIntegral()) {
        *err = "snapshot statistics have no total_size";
        return false;
    }
    *size = root["total_size"].asUInt64();
    return true;
}

static bool check_space(const std::string &dir, uint64_t needed, std::string *err) {
    uint64_t available = 0;
    if (!free_bytes(dir, &available, err)) return false;
    if (available < needed) {
        *err = "archive needs at least " + human_readable(needed) + ", but " + dir + " only has " +
               human_readable(available) + " free";
        return false;
    }
    return true;
}

static void print_pipeline(const std::vector<PipelineStage> &stages, const std::string &output) {
    std::string line;
    for (size_t i = 0; i < stages.size(); i++) {
        if (i > 0) line += " | ";
        line += shell_join(stages[i].argv);
    }
    std::printf("%s > %s\n", line.c_str(), shell_quote(output).c_str());
}

int cmd_archive(const Config &cfg, const RunMode &mode, const ArchiveOptions &opts) {
    std::vector<std::string> tools = {"pv", "zstd"};
    if (opts.encrypt) tools.push_back("openssl");
    for (const auto &tool : tools) {
        if (!find_in_path(tool)) {
            return fail("cannot find " + tool + "; archive needs pv, zstd and (for encryption) openssl on PATH");
        }
    }

    std::string err;
    const Profile *profile = find_profile(cfg, opts.profile, &err);
    if (!profile) return fail(err);
    const Policy *policy = profile_policy(cfg, opts.profile, &err);
    if (!policy) return fail(err);
    std::string location = opts.location.empty() ? policy->locations[0] : opts.location;

    std::vector<std::string> location_args;
    Environment env;
    if (!location_arguments(cfg, location, false, &location_args, &err) ||
        !execution_environment(cfg, location, &env, &err)) {
        return fail(err);
    }

    std::string dest_dir = expand_user(opts.destination);
    if (!path_exists(dest_dir)) {
        return fail("destination directory '" + dest_dir + "' does not exist");
    }
    std::string cache_value = cfg.has_archive && !cfg.archive.cache.empty() ? cfg.archive.cache : cfg.cache;
    bool cache_enabled = !cache_value.empty();
    std::string cache_dir = cache_enabled ? expand_user(cache_value) : dest_dir;

    std::string password_path;
    if (opts.encrypt) {
        std::string value = !opts.password_file.empty() ? opts.password_file : cfg.archive.password_file;
        if (value.empty()) {
            return fail("archive encryption is enabled but no password file was given with --password or archive.password_file");
        }
        password_path = expand_user(value);
    }

    std::vector<std::string> snapshots = opts.snapshots;
    if (snapshots.empty()) snapshots.push_back("latest");

    print_line("Selected profile: " + opts.profile);
    print_line("Location name: " + location);
    std::string names;
    for (size_t i = 0; i < snapshots.size(); i++) {
        if (i > 0) names += ", ";
        names += snapshots[i];
    }
    print_line("Selected snapshots: " + names);

    for (const auto &name : snapshots) {
        if (stop_requested()) return fail("stop requested, not archiving '" + name + "'");
        print_line("Processing '" + name + "':");
        print_nested_line("Querying snapshots for '" + name + "'...");
        SnapshotInfo snap;
        if (!query_snapshot(cfg, location_args, env, name, &snap, &err)) return fail(err);

        std::string timestamp;
        if (!archive_timestamp(snap.time, &timestamp)) {
            return fail("unexpected snapshot time '" + snap.time + "'");
        }
        std::string short_name = profile->archive_name.empty() ? opts.profile : profile->archive_name;
        std::string file_name = short_name + "_" + timestamp + "_" + snap.short_id + ".tar.zst";
        if (opts.encrypt) file_name += ".aes";

        std::string cache_file = cache_dir + "/" + file_name;
        std::string dest_file = dest_dir + "/" + file_name;
        if (path_exists(cache_file)) return fail("archive already exists at '" + cache_file + "'");
        if (path_exists(dest_file)) return fail("final archive already exists at '" + dest_file + "'");

        print_nested_line("Using snapshot ID '" + snap.id.substr(0, 8) + "' with timestamp '" + snap.time + "'");
        print_nested_line("Querying snapshot size...");
        uint64_t size = 0;
        if (!query_snapshot_size(cfg, location_args, env, snap.id, &size, &err)) return fail(err);
        print_nested_line("Archive should be no larger than (approx.) " + human_readable(size));

        if (!check_space(cache_dir, size, &err)) return fail(err);
        if (cache_enabled && !check_space(dest_dir, size, &err)) return fail(err);

        std::vector<PipelineStage> stages(3);
        stages[0].argv = {cfg.restic};
        stages[0].argv.insert(stages[0].argv.end(), location_args.begin(), location_args.end());
        stages[0].argv.push_back("dump");
        stages[0].argv.push_back(snap.id);
        stages[0].argv.push_back("/");
        stages[0].env = &env;
        stages[1].argv = {"pv", "-pterbs", std::to_string(size)};
        stages[2].argv = {"zstd", "-c", "-T8"};
        if (opts.encrypt) {
            PipelineStage encrypt;
            encrypt.argv = openssl_args(password_path, false);
            stages.push_back(encrypt);
        }

        print_nested_line("Creating archive...");
        if (mode.verbose || mode.dry_run) print_pipeline(stages, cache_file);
        if (mode.dry_run) continue;
        int rc = run_pipeline(stages, "", cache_file, &err);
        if (rc != 0) {
            unlink(cache_file.c_str());
            if (rc < 0) return fail(err);
            return fail("creating archive failed with exit code " + std::to_string(rc));
        }

        if (cache_enabled) {
            print_nested_line("Moving archive to final destination...");
            struct stat st;
            if (stat(cache_file.c_str(), &st) != 0) {
                return fail("cannot stat " + cache_file + ": " + std::strerror(errno));
            }
            std::vector<PipelineStage> copy(1);
            copy[0].argv = {"pv", "-pterbs", std::to_string(static_cast<uint64_t>(st.st_size)), cache_file};
            rc = run_pipeline(copy, "", dest_file, &err);
            if (rc != 0) {
                unlink(dest_file.c_str());
                if (rc < 0) return fail(err);
                return fail("copying archive to final destination failed with exit code " + std::to_string(rc));
            }
            unlink(cache_file.c_str());
        }
        print_success("Success! Archive is now available at " + dest_file);
    }
    return 0;
}

int cmd_decrypt(const Config &cfg, const std::string &input, const std::string &output,
                const std::string &password_file) {
    for (const char *tool : {"openssl", "zstd"}) {
        if (!find_in_path(tool)) {
            return fail(std::string("cannot find ") + tool + "; decrypt needs openssl and zstd on PATH");
        }
    }
    if ((output.empty() || output == "-") && isatty(STDOUT_FILENO)) {
        return fail("stdout is a TTY; pipe this command or give an output file");
    }
    std::string value = !password_file.empty() ? password_file : cfg.archive.password_file;
    if (value.empty()) {
        return fail("no password file was given with --password or archive.password_file");
    }
    std::vector<PipelineStage> stages(2);
    stages[0].argv = openssl_args(expand_user(value), true);
    stages[1].argv = {"zstd", "-dc", "-T8"};
    std::string err;
    int rc = run_pipeline(stages, input, output, &err);
    if (rc < 0) return fail(err);
    if (rc != 0) return fail("decrypt failed with exit code " + std::to_string(rc));
    return 0;
}
