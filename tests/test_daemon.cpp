#include "daemon.h"
#include "process.h"
#include "test_util.h"

#include <cassert>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

static const char *FAKE_RESTIC = R"(#!/bin/sh
echo "$*" >> "$FAKE_RESTIC_LOG"
for arg in "$@"; do
    case "$arg" in
        backup)
            echo "snapshot 00ff00ff saved"
            exit "${FAKE_BACKUP_RC:-0}"
            ;;
    esac
done
exit 0
)";

static std::time_t utc(int year, int mon, int day, int hour, int min) {
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_isdst = -1;
    return mktime(&tm);
}

static size_t count_lines(const std::string &text) {
    size_t n = 0;
    for (char c : text) {
        if (c == '\n') n++;
    }
    return n;
}

static Config load(const std::string &yaml) {
    Config cfg;
    std::string err;
    bool ok = parse_config_string(yaml, &cfg, &err);
    if (!ok) std::cerr << "config error: " << err << std::endl;
    assert(ok);
    return cfg;
}

static const char *SCHEDULED = R"(
locations:
  local: {path: /srv/restic}
policies:
  nightly: {location: local, schedule: "30 2 * * *"}
  hourly: {location: local, schedule: "@hourly"}
  manual: {location: local}
profiles:
  home: {policy: nightly}
  mail: {policy: hourly}
  media: {policy: manual}
  loose: {}
)";

void test_build_schedule() {
    Config cfg = load(SCHEDULED);
    std::vector<ScheduledJob> jobs;
    std::string err;
    std::time_t now = utc(2024, 3, 5, 14, 7);
    assert(build_schedule(cfg, now, &jobs, &err));
    assert(jobs.size() == 2);
    // Profiles are visited in name order.
    assert(jobs[0].profile == "home");
    assert(jobs[0].expression == "30 2 * * *");
    assert(jobs[0].next_fire == utc(2024, 3, 6, 2, 30));
    assert(jobs[1].profile == "mail");
    assert(jobs[1].next_fire == utc(2024, 3, 5, 15, 0));
    std::cout << "test_build_schedule passed" << std::endl;
}

void test_build_schedule_without_jobs() {
    Config cfg = load(R"(
locations:
  local: {path: /srv/restic}
policies:
  manual: {location: local}
profiles:
  home: {policy: manual}
)");
    std::vector<ScheduledJob> jobs(3);
    std::string err;
    assert(build_schedule(cfg, utc(2024, 1, 1, 0, 0), &jobs, &err));
    assert(jobs.empty());
    std::cout << "test_build_schedule_without_jobs passed" << std::endl;
}

void test_build_schedule_never_fires() {
    Config cfg = load(R"(
locations:
  local: {path: /srv/restic}
policies:
  leap: {location: local, schedule: "0 0 31 2 *"}
profiles:
  home: {policy: leap}
)");
    std::vector<ScheduledJob> jobs;
    std::string err;
    assert(!build_schedule(cfg, utc(2024, 1, 1, 0, 0), &jobs, &err));
    assert(err.find("home") != std::string::npos);
    std::cout << "test_build_schedule_never_fires passed" << std::endl;
}

void test_next_due_job() {
    std::vector<ScheduledJob> jobs(3);
    jobs[0].profile = "a";
    jobs[0].next_fire = 300;
    jobs[1].profile = "b";
    jobs[1].next_fire = 100;
    jobs[2].profile = "c";
    jobs[2].next_fire = 200;

    assert(next_due_job(jobs, 50) == -1);
    assert(next_due_job(jobs, 100) == 1);
    assert(next_due_job(jobs, 250) == 1);
    jobs[1].next_fire = 1000;
    assert(next_due_job(jobs, 250) == 2);
    assert(next_due_job(jobs, 999) == 2);
    assert(next_due_job(std::vector<ScheduledJob>(), 999) == -1);
    std::cout << "test_next_due_job passed" << std::endl;
}

void test_run_scheduled_job_retries() {
    std::string dir = make_temp_dir();
    std::string log = dir + "/restic.log";
    write_file(dir + "/restic", FAKE_RESTIC, 0755);
    write_file(log, "");
    setenv("FAKE_RESTIC_LOG", log.c_str(), 1);

    Config cfg = load("restic: " + dir + "/restic\n" +
                      "daemon: {retries: 2, retry_delay: 0}\n"
                      "locations:\n"
                      "  local: {path: " + dir + "/repo, password_command: echo secret}\n"
                      "policies:\n"
                      "  nightly: {location: local, schedule: \"@daily\"}\n"
                      "profiles:\n"
                      "  home: {policy: nightly, include: /home}\n");
    std::vector<ScheduledJob> jobs;
    std::string err;
    assert(build_schedule(cfg, utc(2024, 1, 1, 12, 0), &jobs, &err));
    assert(jobs.size() == 1);

    RunMode mode;
    setenv("FAKE_BACKUP_RC", "1", 1);
    assert(run_scheduled_job(cfg, mode, jobs[0]) == 1);
    assert(count_lines(read_file(log)) == 3);

    write_file(log, "");
    unsetenv("FAKE_BACKUP_RC");
    assert(run_scheduled_job(cfg, mode, jobs[0]) == 0);
    assert(count_lines(read_file(log)) == 1);

    unsetenv("FAKE_RESTIC_LOG");
    remove_tree(dir);
    std::cout << "test_run_scheduled_job_retries passed" << std::endl;
}

static std::string setup_fake_restic(const std::string &dir) {
    std::string log = dir + "/restic.log";
    write_file(dir + "/restic", FAKE_RESTIC, 0755);
    write_file(log, "");
    setenv("FAKE_RESTIC_LOG", log.c_str(), 1);
    unsetenv("FAKE_BACKUP_RC");
    return log;
}

static Config hourly_config(const std::string &dir) {
    return load("restic: " + dir + "/restic\n" +
                "locations:\n"
                "  local: {path: " + dir + "/repo, password_command: echo secret}\n"
                "policies:\n"
                "  hourly: {location: local, schedule: \"0 * * * *\"}\n"
                "  manual: {location: local}\n"
                "profiles:\n"
                "  home: {policy: hourly, include: /home}\n"
                "  mail: {policy: manual, include: /mail}\n");
}

void test_run_due_job_coalesces() {
    std::string dir = make_temp_dir();
    std::string log = setup_fake_restic(dir);
    Config cfg = hourly_config(dir);
    std::vector<ScheduledJob> jobs;
    std::string err;
    assert(build_schedule(cfg, utc(2024, 1, 1, 8, 30), &jobs, &err));
    assert(jobs.size() == 1);
    assert(jobs[0].next_fire == utc(2024, 1, 1, 9, 0));

    RunMode mode;
    // 09:00 through 12:00 were missed; they produce a single run.
    assert(run_due_job(cfg, mode, &jobs, utc(2024, 1, 1, 12, 30)));
    assert(count_lines(read_file(log)) == 1);
    assert(jobs[0].next_fire == utc(2024, 1, 1, 13, 0));

    assert(!run_due_job(cfg, mode, &jobs, utc(2024, 1, 1, 12, 45)));
    assert(count_lines(read_file(log)) == 1);

    // Dispatched exactly on a fire time: the next one is strictly later.
    assert(run_due_job(cfg, mode, &jobs, utc(2024, 1, 1, 13, 0)));
    assert(count_lines(read_file(log)) == 2);
    assert(jobs[0].next_fire == utc(2024, 1, 1, 14, 0));

    // A failed run is still rescheduled.
    setenv("FAKE_BACKUP_RC", "1", 1);
    assert(run_due_job(cfg, mode, &jobs, utc(2024, 1, 1, 14, 5)));
    assert(jobs.size() == 1);
    assert(jobs[0].next_fire == utc(2024, 1, 1, 15, 0));

    unsetenv("FAKE_BACKUP_RC");
    unsetenv("FAKE_RESTIC_LOG");
    remove_tree(dir);
    std::cout << "test_run_due_job_coalesces passed" << std::endl;
}

void test_run_due_job_order_and_drop() {
    std::string dir = make_temp_dir();
    std::string log = setup_fake_restic(dir);
    Config cfg = hourly_config(dir);
    std::string err;

    std::vector<ScheduledJob> jobs(2);
    jobs[0].profile = "home";
    jobs[0].expression = "0 * * * *";
    assert(parse_cron(jobs[0].expression, &jobs[0].schedule, &err));
    jobs[0].next_fire = utc(2024, 1, 1, 10, 0);
    jobs[1].profile = "mail";
    jobs[1].expression = "0 0 31 2 *";
    assert(parse_cron(jobs[1].expression, &jobs[1].schedule, &err));
    jobs[1].next_fire = utc(2024, 1, 1, 9, 0);

    RunMode mode;
    std::time_t now = utc(2024, 1, 1, 10, 30);
    // The earliest due job goes first, and is dropped as it never fires again.
    assert(run_due_job(cfg, mode, &jobs, now));
    std::string text = read_file(log);
    assert(count_lines(text) == 1);
    assert(text.find("/mail") != std::string::npos);
    assert(jobs.size() == 1);
    assert(jobs[0].profile == "home");

    assert(run_due_job(cfg, mode, &jobs, now));
    text = read_file(log);
    assert(count_lines(text) == 2);
    assert(text.find("/home") != std::string::npos);
    assert(jobs[0].next_fire == utc(2024, 1, 1, 11, 0));

    unsetenv("FAKE_RESTIC_LOG");
    remove_tree(dir);
    std::cout << "test_run_due_job_order_and_drop passed" << std::endl;
}

// Runs the daemon with stderr sent to `path` and returns what it wrote there.
static int daemon_with_stderr(const Config &cfg, const std::string &path, std::string *text) {
    std::fflush(stderr);
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    assert(fd >= 0);
    int saved = dup(STDERR_FILENO);
    dup2(fd, STDERR_FILENO);
    close(fd);
    RunMode mode;
    int rc = cmd_daemon(cfg, mode);
    std::fflush(stderr);
    dup2(saved, STDERR_FILENO);
    close(saved);
    *text = read_file(path);
    return rc;
}

void test_daemon_stops_on_signal() {
    std::string dir = make_temp_dir();
    std::string log = setup_fake_restic(dir);
    Config cfg = hourly_config(dir);

    install_signal_handlers();
    clear_stop_request();
    raise(SIGTERM);
    std::string text;
    assert(daemon_with_stderr(cfg, dir + "/stderr.txt", &text) == 0);
    assert(text.find("Starting scheduler...") != std::string::npos);
    assert(text.find("Scheduler stopping...") != std::string::npos);
    assert(count_lines(read_file(log)) == 0);
    clear_stop_request();

    unsetenv("FAKE_RESTIC_LOG");
    remove_tree(dir);
    std::cout << "test_daemon_stops_on_signal passed" << std::endl;
}

void test_daemon_without_jobs() {
    std::string dir = make_temp_dir();
    Config cfg = load(R"(
locations:
  local: {path: /srv/restic}
policies:
  manual: {location: local}
profiles:
  home: {policy: manual}
)");
    std::string text;
    assert(daemon_with_stderr(cfg, dir + "/stderr.txt", &text) == 0);
    assert(text.find("No jobs scheduled") != std::string::npos);
    assert(text.find("Starting scheduler...") == std::string::npos);
    remove_tree(dir);
    std::cout << "test_daemon_without_jobs passed" << std::endl;
}

int main() {
    setenv("TZ", "UTC", 1);
    tzset();

    test_build_schedule();
    test_build_schedule_without_jobs();
    test_build_schedule_never_fires();
    test_next_due_job();
    test_run_scheduled_job_retries();
    test_run_due_job_coalesces();
    test_run_due_job_order_and_drop();
    test_daemon_stops_on_signal();
    test_daemon_without_jobs();

    std::cout << "All daemon tests passed!" << std::endl;
    return 0;
}
