#ifndef RESTICD_CRON_H
#define RESTICD_CRON_H

#include <cstdint>
#include <ctime>
#include <string>

// Five-field crontab expression, evaluated in local time.
struct CronSchedule {
    uint64_t minutes = 0;
    uint32_t hours = 0;
    uint32_t days = 0;
    uint32_t months = 0;
    uint32_t weekdays = 0;
    bool days_restricted = false;
    bool weekdays_restricted = false;
};

bool parse_cron(const std::string &expr, CronSchedule *out, std::string *err);
bool cron_matches(const CronSchedule &schedule, const struct tm &tm);

// First matching minute strictly after `after`. Fails when nothing matches
// within the search horizon (e.g. "0 0 30 2 *").
bool cron_next(const CronSchedule &schedule, std::time_t after, std::time_t *next);

#endif
