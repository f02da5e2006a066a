#include "commands.h"
#include "config.h"
#include "process.h"
#include "test_util.h"

#include <cassert>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

static const char *FAKE_RESTIC = R"(#!/bin/sh
{
    echo "---"
    for arg in "$@"; do echo "$arg"; done
} >> "$FAKE_RESTIC_LOG"
for arg in "$@"; do
    case "$arg" in
        backup)
            echo "Files: 3 new, 0 changed, 0 unmodified"
            echo "snapshot 1a2b3c4d saved"
            exit "${FAKE_BACKUP_RC:-0}"
            ;;
        snapshots)
            echo '[{"time":"2024-03-05T14:07:09.123456789+01:00","id":"0123456789abcdef","short_id":"01234567"}]'
            exit 0
            ;;
        stats)
            echo '{"total_size":1024,"total_file_count":3}'
            exit 0
            ;;
        dump)
            printf 'TARDATA'
            exit 0
            ;;
        copy)
            if [ -n "$FAKE_COPY_SIGNAL" ]; then
                kill -TERM "$PPID"
                exit 130
            fi
            exit "${FAKE_OTHER_RC:-0}"
            ;;
        forget|init|prune|mount)
            exit "${FAKE_OTHER_RC:-0}"
            ;;
    esac
done
exit 0
)";

// Stands in for pv: copies its file argument, or stdin.
static const char *FAKE_PV = R"(#!/bin/sh
for arg in "$@"; do last="$arg"; done
if [ -f "$last" ]; then cat "$last"; else cat; fi
)";

static const char *FAKE_ZSTD = "#!/bin/sh\ncat\n";

// Stands in for openssl enc: "encrypts" by prefixing the password line and
// refuses to decrypt with a different password.
static const char *FAKE_OPENSSL = R"(#!/bin/sh
pass=""
mode=""
while [ $# -gt 0 ]; do
    case "$1" in
        -pass) pass="${2#file:}"; shift ;;
        -e) mode=e ;;
        -d) mode=d ;;
    esac
    shift
done
key=$(cat "$pass") || exit 1
if [ "$mode" = e ]; then
    echo "$key"
    cat
else
    read -r first || exit 1
    if [ "$first" != "$key" ]; then
        echo "bad decrypt" >&2
        exit 1
    fi
    cat
fi
)";

typedef std::vector<std::vector<std::string>> Invocations;

static Invocations read_invocations(const std::string &log) {
    Invocations out;
    std::stringstream ss(read_file(log));
    std::string line;
    while (std::getline(ss, line)) {
        if (line == "---") {
            out.push_back(std::vector<std::string>());
        } else if (!out.empty()) {
            out.back().push_back(line);
        }
    }
    return out;
}

static std::string value_after(const std::vector<std::string> &argv, const std::string &flag) {
    int idx = index_of(argv, flag);
    assert(idx >= 0 && static_cast<size_t>(idx) + 1 < argv.size());
    return argv[static_cast<size_t>(idx) + 1];
}

struct Fixture {
    std::string dir;
    std::string log;
    Config cfg;
};

static Fixture setup() {
    Fixture f;
    f.dir = make_temp_dir();
    f.log = f.dir + "/restic.log";
    write_file(f.dir + "/restic", FAKE_RESTIC, 0755);
    write_file(f.dir + "/pass", "secret\n", 0600);
    write_file(f.log, "");
    mkdir((f.dir + "/stage").c_str(), 0755);
    mkdir((f.dir + "/dest").c_str(), 0755);
    mkdir((f.dir + "/bin").c_str(), 0755);
    write_file(f.dir + "/bin/pv", FAKE_PV, 0755);
    write_file(f.dir + "/bin/zstd", FAKE_ZSTD, 0755);
    write_file(f.dir + "/bin/openssl", FAKE_OPENSSL, 0755);
    write_file(f.dir + "/archive-pass", "archive-default\n", 0600);
    write_file(f.dir + "/other-pass", "given-on-command-line\n", 0600);
    setenv("FAKE_RESTIC_LOG", f.log.c_str(), 1);
    unsetenv("FAKE_BACKUP_RC");
    unsetenv("FAKE_OTHER_RC");
    unsetenv("FAKE_COPY_SIGNAL");

    std::string yaml =
        "restic: " + f.dir + "/restic\n"
        "locations:\n"
        "  primary: {path: " + f.dir + "/primary, password_file: " + f.dir + "/pass}\n"
        "  secondary: {path: " + f.dir + "/secondary, password_file: " + f.dir + "/pass}\n"
        "  tertiary: {path: " + f.dir + "/tertiary, password_file: " + f.dir + "/pass}\n"
        "policies:\n"
        "  nightly: {location: [primary, secondary], retention: {keep_daily: 7}}\n"
        "  single: {location: primary}\n"
        "  triple: {location: [primary, secondary, tertiary], retention: {keep_last: 3}}\n"
        "profiles:\n"
        "  home: {policy: nightly, hostname: nas, tags: [home], include: [/home]}\n"
        "  auto: {policy: nightly, auto_apply: true, include: [/srv]}\n"
        "  solo: {policy: single, include: [/opt]}\n"
        "  wide: {policy: triple, auto_apply: true, include: [/var]}\n"
        "archive: {cache: " + f.dir + "/stage, password_file: " + f.dir + "/archive-pass}\n";
    std::string err;
    bool ok = parse_config_string(yaml, &f.cfg, &err);
    if (!ok) std::cerr << "config error: " << err << std::endl;
    assert(ok);
    return f;
}

static void teardown(const Fixture &f) {
    remove_tree(f.dir);
}

void test_parse_snapshot_id() {
    std::string id;
    assert(parse_snapshot_id("Added to the repository: 1 KiB\nsnapshot 9f8e7d6c saved\n", &id));
    assert(id == "9f8e7d6c");
    assert(parse_snapshot_id("snapshot list\nsnapshot abc_123 saved", &id));
    assert(id == "abc_123");
    assert(!parse_snapshot_id("snapshot  saved\n", &id));
    assert(!parse_snapshot_id("nothing here", &id));
    std::cout << "test_parse_snapshot_id passed" << std::endl;
}

void test_archive_timestamp() {
    std::string ts;
    assert(archive_timestamp("2024-03-05T14:07:09.123456789+01:00", &ts));
    assert(ts == "20240305140709");
    assert(archive_timestamp("2023-12-31T23:59:59Z", &ts));
    assert(ts == "20231231235959");
    assert(!archive_timestamp("2024-03-05", &ts));
    assert(!archive_timestamp("yesterday at noon, roughly", &ts));
    std::cout << "test_archive_timestamp passed" << std::endl;
}

void test_run_copies_to_secondaries() {
    Fixture f = setup();
    RunMode mode;
    RunOptions opts;
    opts.profile = "home";
    assert(cmd_run(f.cfg, mode, opts) == 0);

    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 2);
    const std::vector<std::string> &backup = calls[0];
    assert(contains(backup, "backup"));
    assert(value_after(backup, "--repo") == f.dir + "/primary");
    assert(value_after(backup, "--password-file") == f.dir + "/pass");
    assert(value_after(backup, "--host") == "nas");
    assert(value_after(backup, "--tag") == "home");
    assert(backup.back() == "/home");

    const std::vector<std::string> &copy = calls[1];
    assert(contains(copy, "copy"));
    assert(value_after(copy, "--repo") == f.dir + "/secondary");
    assert(value_after(copy, "--from-repo") == f.dir + "/primary");
    assert(value_after(copy, "--from-password-file") == f.dir + "/pass");
    assert(copy.back() == "1a2b3c4d");
    teardown(f);
    std::cout << "test_run_copies_to_secondaries passed" << std::endl;
}

void test_run_dry_run() {
    Fixture f = setup();
    RunMode mode;
    mode.dry_run = true;
    RunOptions opts;
    opts.profile = "home";
    assert(cmd_run(f.cfg, mode, opts) == 0);
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(calls[0].back() == "--dry-run");
    teardown(f);
    std::cout << "test_run_dry_run passed" << std::endl;
}

void test_run_incomplete_backup() {
    Fixture f = setup();
    setenv("FAKE_BACKUP_RC", "3", 1);
    RunMode mode;
    RunOptions opts;
    opts.profile = "home";
    assert(cmd_run(f.cfg, mode, opts) == 0);
    assert(read_invocations(f.log).size() == 2);
    teardown(f);
    std::cout << "test_run_incomplete_backup passed" << std::endl;
}

void test_run_failed_backup() {
    Fixture f = setup();
    setenv("FAKE_BACKUP_RC", "1", 1);
    RunMode mode;
    RunOptions opts;
    opts.profile = "home";
    assert(cmd_run(f.cfg, mode, opts) == EXIT_FAILED);
    assert(read_invocations(f.log).size() == 1);
    teardown(f);
    std::cout << "test_run_failed_backup passed" << std::endl;
}

void test_run_location_override() {
    Fixture f = setup();
    RunMode mode;
    RunOptions opts;
    opts.profile = "home";
    opts.locations.push_back("secondary");
    assert(cmd_run(f.cfg, mode, opts) == 0);
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(value_after(calls[0], "--repo") == f.dir + "/secondary");

    opts.locations.push_back("nowhere");
    assert(cmd_run(f.cfg, mode, opts) == EXIT_FAILED);
    teardown(f);
    std::cout << "test_run_location_override passed" << std::endl;
}

void test_run_no_copy() {
    Fixture f = setup();
    RunMode mode;
    RunOptions opts;
    opts.profile = "home";
    opts.no_copy = true;
    assert(cmd_run(f.cfg, mode, opts) == 0);
    assert(read_invocations(f.log).size() == 1);
    teardown(f);
    std::cout << "test_run_no_copy passed" << std::endl;
}

void test_run_unknown_profile() {
    Fixture f = setup();
    RunMode mode;
    RunOptions opts;
    opts.profile = "nobody";
    assert(cmd_run(f.cfg, mode, opts) == EXIT_FAILED);
    opts.profile = "home";
    opts.groups.push_back("missing");
    assert(cmd_run(f.cfg, mode, opts) == EXIT_FAILED);
    assert(read_invocations(f.log).empty());
    teardown(f);
    std::cout << "test_run_unknown_profile passed" << std::endl;
}

void test_run_auto_apply() {
    Fixture f = setup();
    RunMode mode;
    RunOptions opts;
    opts.profile = "auto";
    assert(cmd_run(f.cfg, mode, opts) == 0);
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 4);
    assert(contains(calls[0], "backup"));
    assert(contains(calls[1], "copy"));
    for (size_t i = 2; i < 4; i++) {
        assert(contains(calls[i], "forget"));
        assert(value_after(calls[i], "--group-by").empty());
        assert(value_after(calls[i], "--keep-daily") == "7");
        assert(!contains(calls[i], "--prune"));
    }
    assert(value_after(calls[2], "--repo") == f.dir + "/primary");
    assert(value_after(calls[3], "--repo") == f.dir + "/secondary");
    teardown(f);
    std::cout << "test_run_auto_apply passed" << std::endl;
}

void test_apply() {
    Fixture f = setup();
    RunMode mode;
    assert(cmd_apply(f.cfg, mode, "home", true, {}) == 0);
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 2);
    assert(contains(calls[0], "--prune"));
    assert(value_after(calls[0], "--tag") == "home");

    write_file(f.log, "");
    assert(cmd_apply(f.cfg, mode, "home", false, {"secondary"}) == 0);
    calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(value_after(calls[0], "--repo") == f.dir + "/secondary");

    // A policy without retention rules cannot be applied.
    write_file(f.log, "");
    assert(cmd_apply(f.cfg, mode, "solo", false, {}) == EXIT_FAILED);
    assert(read_invocations(f.log).empty());

    setenv("FAKE_OTHER_RC", "1", 1);
    assert(cmd_apply(f.cfg, mode, "home", false, {}) == EXIT_FAILED);
    teardown(f);
    std::cout << "test_apply passed" << std::endl;
}

void test_copy_and_init() {
    Fixture f = setup();
    RunMode mode;
    assert(cmd_copy(f.cfg, mode, "primary", "primary", {"abc"}) == EXIT_FAILED);
    assert(cmd_copy(f.cfg, mode, "primary", "secondary", {}) == EXIT_FAILED);
    assert(read_invocations(f.log).empty());

    assert(cmd_copy(f.cfg, mode, "primary", "secondary", {"abc", "def"}) == 0);
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(value_after(calls[0], "--repo") == f.dir + "/secondary");
    assert(value_after(calls[0], "--from-repo") == f.dir + "/primary");
    assert(calls[0][calls[0].size() - 2] == "abc");
    assert(calls[0].back() == "def");

    write_file(f.log, "");
    assert(cmd_init(f.cfg, mode, "secondary", "primary", {"--repository-version", "2"}) == 0);
    calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(index_of(calls[0], "--repository-version") < index_of(calls[0], "init"));
    assert(value_after(calls[0], "--from-repo") == f.dir + "/primary");
    assert(calls[0].back() == "--copy-chunker-params");
    teardown(f);
    std::cout << "test_copy_and_init passed" << std::endl;
}

void test_foreground_exit_code() {
    Fixture f = setup();
    RunMode mode;
    setenv("FAKE_OTHER_RC", "5", 1);
    assert(cmd_execute(f.cfg, mode, "primary", {"prune", "--max-unused", "5%"}) == 5);
    assert(cmd_prune(f.cfg, mode, "primary") == EXIT_FAILED);
    unsetenv("FAKE_OTHER_RC");
    unsetenv("FAKE_COPY_SIGNAL");
    assert(cmd_execute(f.cfg, mode, "primary", {"check"}) == 0);
    assert(cmd_execute(f.cfg, mode, "nowhere", {"check"}) == EXIT_FAILED);
    teardown(f);
    std::cout << "test_foreground_exit_code passed" << std::endl;
}

void test_snapshots_and_mount() {
    Fixture f = setup();
    RunMode mode;
    assert(cmd_snapshots(f.cfg, mode, "home", true, "") == 0);
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(value_after(calls[0], "--tag") == "home");
    assert(calls[0].back() == "--json");

    write_file(f.log, "");
    assert(cmd_mount(f.cfg, mode, "home", f.dir + "/dest", "secondary") == 0);
    calls = read_invocations(f.log);
    assert(calls.size() == 1);
    assert(value_after(calls[0], "--repo") == f.dir + "/secondary");
    assert(calls[0].back() == f.dir + "/dest");

    assert(cmd_mount(f.cfg, mode, "home", f.dir + "/no-mount-point", "") == EXIT_FAILED);
    teardown(f);
    std::cout << "test_snapshots_and_mount passed" << std::endl;
}

void test_archive() {
    Fixture f = setup();
    std::string old_path = getenv("PATH") ? getenv("PATH") : "/usr/bin:/bin";
    std::string path = f.dir + "/bin:" + old_path;
    setenv("PATH", path.c_str(), 1);

    RunMode mode;
    ArchiveOptions opts;
    opts.destination = f.dir + "/dest";
    opts.profile = "home";
    assert(cmd_archive(f.cfg, mode, opts) == 0);

    std::string archive = f.dir + "/dest/home_20240305140709_01234567.tar.zst";
    assert(read_file(archive) == "TARDATA");
    // Staged through the archive cache, which is emptied afterwards.
    assert(access((f.dir + "/stage/home_20240305140709_01234567.tar.zst").c_str(), F_OK) != 0);

    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 3);
    assert(contains(calls[0], "snapshots") && contains(calls[0], "latest"));
    assert(contains(calls[1], "stats") && contains(calls[1], "0123456789abcdef"));
    assert(contains(calls[2], "dump"));

    // Refuses to overwrite an existing archive.
    assert(cmd_archive(f.cfg, mode, opts) == EXIT_FAILED);

    // Encryption needs a password file.
    opts.encrypt = true;
    f.cfg.archive.password_file.clear();
    assert(cmd_archive(f.cfg, mode, opts) == EXIT_FAILED);

    opts.encrypt = false;
    opts.destination = f.dir + "/missing";
    assert(cmd_archive(f.cfg, mode, opts) == EXIT_FAILED);

    setenv("PATH", old_path.c_str(), 1);
    teardown(f);
    std::cout << "test_archive passed" << std::endl;
}

void test_run_stops_after_signal() {
    Fixture f = setup();
    setenv("FAKE_COPY_SIGNAL", "1", 1);
    clear_stop_request();
    RunMode mode;
    RunOptions opts;
    opts.profile = "wide";
    assert(cmd_run(f.cfg, mode, opts) == EXIT_FAILED);
    assert(stop_requested());

    // Nothing starts once the copy to the first secondary was interrupted.
    Invocations calls = read_invocations(f.log);
    assert(calls.size() == 2);
    assert(contains(calls[0], "backup"));
    assert(contains(calls[1], "copy"));
    assert(value_after(calls[1], "--repo") == f.dir + "/secondary");
    clear_stop_request();
    teardown(f);
    std::cout << "test_run_stops_after_signal passed" << std::endl;
}

void test_stop_before_apply_and_archive() {
    Fixture f = setup();
    std::string old_path = getenv("PATH") ? getenv("PATH") : "/usr/bin:/bin";
    std::string path = f.dir + "/bin:" + old_path;
    setenv("PATH", path.c_str(), 1);
    clear_stop_request();
    raise(SIGTERM);
    assert(stop_requested());

    RunMode mode;
    assert(cmd_apply(f.cfg, mode, "home", false, {}) == EXIT_FAILED);
    ArchiveOptions opts;
    opts.destination = f.dir + "/dest";
    opts.profile = "home";
    assert(cmd_archive(f.cfg, mode, opts) == EXIT_FAILED);
    RunOptions run;
    run.profile = "home";
    assert(cmd_run(f.cfg, mode, run) == EXIT_FAILED);
    assert(read_invocations(f.log).empty());

    clear_stop_request();
    setenv("PATH", old_path.c_str(), 1);
    teardown(f);
    std::cout << "test_stop_before_apply_and_archive passed" << std::endl;
}

// Points `fd` at `replacement` and returns a duplicate of the original.
static int redirect_fd(int fd, int replacement) {
    std::fflush(stdout);
    int saved = dup(fd);
    assert(saved >= 0);
    assert(dup2(replacement, fd) >= 0);
    return saved;
}

static void restore_fd(int fd, int saved) {
    std::fflush(stdout);
    dup2(saved, fd);
    close(saved);
}

void test_archive_encryption() {
    Fixture f = setup();
    std::string old_path = getenv("PATH") ? getenv("PATH") : "/usr/bin:/bin";
    std::string path = f.dir + "/bin:" + old_path;
    setenv("PATH", path.c_str(), 1);

    RunMode mode;
    ArchiveOptions opts;
    opts.destination = f.dir + "/dest";
    opts.profile = "home";
    opts.encrypt = true;
    std::string archive = f.dir + "/dest/home_20240305140709_01234567.tar.zst.aes";

    // Without --password the archive password file from the config is used.
    assert(cmd_archive(f.cfg, mode, opts) == 0);
    assert(read_file(archive) == "archive-default\nTARDATA");
    std::string plain = f.dir + "/plain.tar";
    assert(cmd_decrypt(f.cfg, archive, plain, "") == 0);
    assert(read_file(plain) == "TARDATA");
    unlink(archive.c_str());

    // --password takes precedence over the config.
    opts.password_file = f.dir + "/other-pass";
    assert(cmd_archive(f.cfg, mode, opts) == 0);
    assert(read_file(archive) == "given-on-command-line\nTARDATA");
    assert(cmd_decrypt(f.cfg, archive, plain, "") == EXIT_FAILED);
    assert(cmd_decrypt(f.cfg, archive, plain, f.dir + "/other-pass") == 0);
    assert(read_file(plain) == "TARDATA");

    // "-" reads the archive from stdin.
    int in = open(archive.c_str(), O_RDONLY);
    assert(in >= 0);
    int saved_stdin = redirect_fd(STDIN_FILENO, in);
    close(in);
    std::string from_stdin = f.dir + "/from-stdin.tar";
    int rc = cmd_decrypt(f.cfg, "-", from_stdin, f.dir + "/other-pass");
    restore_fd(STDIN_FILENO, saved_stdin);
    assert(rc == 0);
    assert(read_file(from_stdin) == "TARDATA");

    Config no_password = f.cfg;
    no_password.archive.password_file.clear();
    assert(cmd_decrypt(no_password, archive, plain, "") == EXIT_FAILED);
    assert(cmd_decrypt(f.cfg, f.dir + "/absent.aes", plain, "") == EXIT_FAILED);

    // A terminal is never used as the output.
    int master = posix_openpt(O_RDWR | O_NOCTTY);
    if (master >= 0 && grantpt(master) == 0 && unlockpt(master) == 0) {
        int slave = open(ptsname(master), O_RDWR | O_NOCTTY);
        assert(slave >= 0);
        int saved_stdout = redirect_fd(STDOUT_FILENO, slave);
        rc = cmd_decrypt(f.cfg, archive, "-", f.dir + "/other-pass");
        restore_fd(STDOUT_FILENO, saved_stdout);
        close(slave);
        assert(rc == EXIT_FAILED);
    } else {
        std::cout << "no pseudo terminal available, terminal output check skipped" << std::endl;
    }
    if (master >= 0) close(master);

    setenv("PATH", old_path.c_str(), 1);
    teardown(f);
    std::cout << "test_archive_encryption passed" << std::endl;
}

int main() {
    install_signal_handlers();
    test_parse_snapshot_id();
    test_archive_timestamp();
    test_run_copies_to_secondaries();
    test_run_dry_run();
    test_run_incomplete_backup();
    test_run_failed_backup();
    test_run_location_override();
    test_run_no_copy();
    test_run_unknown_profile();
    test_run_auto_apply();
    test_apply();
    test_copy_and_init();
    test_foreground_exit_code();
    test_snapshots_and_mount();
    test_archive();
    test_archive_encryption();
    test_run_stops_after_signal();
    test_stop_before_apply_and_archive();

    std::cout << "All command tests passed!" << std::endl;
    return 0;
}
