#include "daemon.h"

#include "commands.h"
#include "process.h"

#include <algorithm>
#include <time.h>

// Upper bound on a single sleep so wall clock jumps are noticed.
static const int MAX_SLEEP_SECONDS = 60;

static void sleep_interruptible(int seconds) {
    for (int i = 0; i < seconds && !stop_requested(); i++) {
        struct timespec ts = {1, 0};
        nanosleep(&ts, nullptr);
    }
}

bool build_schedule(const Config &cfg, std::time_t now, std::vector<ScheduledJob> *jobs, std::string *err) {
    jobs->clear();
    for (const auto &entry : cfg.profiles) {
        const Profile &profile = entry.second;
        if (profile.policy.empty()) continue;
        const Policy *policy = find_policy(cfg, profile.policy, err);
        if (!policy) return false;
        if (policy->schedule.empty()) continue;

        ScheduledJob job;
        job.profile = entry.first;
        job.expression = policy->schedule;
        if (!parse_cron(policy->schedule, &job.schedule, err)) {
            *err = "profile " + entry.first + ": " + *err;
            return false;
        }
        if (!cron_next(job.schedule, now, &job.next_fire)) {
            *err = "profile " + entry.first + ": schedule '" + policy->schedule + "' never fires";
            return false;
        }
        jobs->push_back(job);
    }
    return true;
}

int next_due_job(const std::vector<ScheduledJob> &jobs, std::time_t now) {
    int best = -1;
    for (size_t i = 0; i < jobs.size(); i++) {
        if (jobs[i].next_fire > now) continue;
        if (best < 0 || jobs[i].next_fire < jobs[static_cast<size_t>(best)].next_fire) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

int run_scheduled_job(const Config &cfg, const RunMode &mode, const ScheduledJob &job) {
    RunOptions opts;
    opts.profile = job.profile;
    int attempts = 1 + cfg.daemon.retries;
    int rc = 0;
    for (int attempt = 1; attempt <= attempts; attempt++) {
        print_line("Scheduled run of '" + job.profile + "' (attempt " + std::to_string(attempt) + " of " +
                   std::to_string(attempts) + ")");
        rc = cmd_run(cfg, mode, opts);
        if (rc == 0 || stop_requested()) break;
        print_warning("Warning: scheduled run of '" + job.profile + "' failed with exit code " + std::to_string(rc));
        if (attempt < attempts) {
            print_nested_line("Retrying in " + std::to_string(cfg.daemon.retry_delay) + " seconds");
            sleep_interruptible(cfg.daemon.retry_delay);
            if (stop_requested()) break;
        }
    }
    return rc;
}

bool run_due_job(const Config &cfg, const RunMode &mode, std::vector<ScheduledJob> *jobs, std::time_t now) {
    int idx = next_due_job(*jobs, now);
    if (idx < 0) return false;

    ScheduledJob &job = (*jobs)[static_cast<size_t>(idx)];
    int rc = run_scheduled_job(cfg, mode, job);
    if (rc != 0 && !stop_requested()) {
        print_error("Error: profile '" + job.profile + "' failed, waiting for its next scheduled run");
    }
    // Fire times missed while running collapse into a single run.
    if (!cron_next(job.schedule, now, &job.next_fire)) {
        print_warning("Warning: schedule for '" + job.profile + "' has no further fire times, dropping it");
        jobs->erase(jobs->begin() + idx);
        return true;
    }
    print_nested_line(job.profile + ": next at " + format_time(job.next_fire));
    return true;
}

int cmd_daemon(const Config &cfg, const RunMode &mode) {
    print_line("Scheduling jobs for applicable profiles...");
    std::vector<ScheduledJob> jobs;
    std::string err;
    if (!build_schedule(cfg, std::time(nullptr), &jobs, &err)) {
        print_error("Error: " + err);
        return EXIT_USAGE;
    }
    for (const auto &job : jobs) {
        print_nested_line(job.profile + ": " + job.expression + " (next at " + format_time(job.next_fire) + ")");
    }
    if (jobs.empty()) {
        print_warning("No jobs scheduled. Check your configuration and try again. Exiting...");
        return 0;
    }

    print_warning("Starting scheduler...");
    while (!stop_requested() && !jobs.empty()) {
        std::time_t now = std::time(nullptr);
        if (run_due_job(cfg, mode, &jobs, now)) continue;

        std::time_t earliest = jobs[0].next_fire;
        for (const auto &job : jobs) earliest = std::min(earliest, job.next_fire);
        long wait = static_cast<long>(earliest - now);
        sleep_interruptible(static_cast<int>(std::min<long>(std::max<long>(wait, 1), MAX_SLEEP_SECONDS)));
    }
    print_warning("Scheduler stopping...");
    return 0;
}
