#ifndef RESTICD_DAEMON_H
#define RESTICD_DAEMON_H

#include "config.h"
#include "cron.h"
#include "output.h"

#include <ctime>
#include <string>
#include <vector>

struct ScheduledJob {
    std::string profile;
    std::string expression;
    CronSchedule schedule;
    std::time_t next_fire = 0;
};

// One job per profile whose policy has a schedule, next fire times after now.
bool build_schedule(const Config &cfg, std::time_t now, std::vector<ScheduledJob> *jobs, std::string *err);

// Index of the due job with the earliest fire time, -1 when none is due.
int next_due_job(const std::vector<ScheduledJob> &jobs, std::time_t now);

// Runs the profile, retrying per the daemon settings. Returns the last exit code.
int run_scheduled_job(const Config &cfg, const RunMode &mode, const ScheduledJob &job);

// Runs the earliest job due at `now`, then moves its next fire time to the
// first match after `now`. A job whose schedule never fires again is removed.
// Returns false when nothing was due.
bool run_due_job(const Config &cfg, const RunMode &mode, std::vector<ScheduledJob> *jobs, std::time_t now);

int cmd_daemon(const Config &cfg, const RunMode &mode);

#endif
