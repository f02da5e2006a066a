#include "cron.h"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

static const int SEARCH_YEARS = 5;

static const char *MONTH_NAMES[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                    "jul", "aug", "sep", "oct", "nov", "dec"};
static const char *WEEKDAY_NAMES[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

struct FieldSpec {
    const char *label;
    int min;
    int max;
    const char **names;
    int name_count;
    int name_base;
};

static bool parse_value(const std::string &text, const FieldSpec &spec, int *value) {
    if (text.empty()) return false;
    if (spec.names) {
        std::string lower = text;
        for (auto &c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        for (int i = 0; i < spec.name_count; i++) {
            if (lower == spec.names[i]) {
                *value = spec.name_base + i;
                return true;
            }
        }
    }
    // No field goes past two digits.
    if (text.size() > 2) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    *value = std::atoi(text.c_str());
    return *value >= spec.min && *value <= spec.max;
}

static bool parse_field(const std::string &field, const FieldSpec &spec, uint64_t *bits, bool *restricted, std::string *err) {
    *bits = 0;
    // A field starting with "*" (such as "*/2") does not restrict the day.
    *restricted = field[0] != '*' && field[0] != '?';
    std::stringstream ss(field);
    std::string part;
    while (std::getline(ss, part, ',')) {
        int step = 1;
        size_t slash = part.find('/');
        if (slash != std::string::npos) {
            std::string step_text = part.substr(slash + 1);
            FieldSpec step_spec = {spec.label, 1, spec.max, nullptr, 0, 0};
            if (!parse_value(step_text, step_spec, &step)) {
                *err = std::string("invalid step in ") + spec.label + " field: " + part;
                return false;
            }
            part = part.substr(0, slash);
        }
        int lo = spec.min;
        int hi = spec.max;
        if (part == "*" || part == "?") {
            // full range
        } else {
            size_t dash = part.find('-');
            if (dash != std::string::npos) {
                if (!parse_value(part.substr(0, dash), spec, &lo) ||
                    !parse_value(part.substr(dash + 1), spec, &hi) || lo > hi) {
                    *err = std::string("invalid range in ") + spec.label + " field: " + part;
                    return false;
                }
            } else {
                if (!parse_value(part, spec, &lo)) {
                    *err = std::string("invalid value in ") + spec.label + " field: " + part;
                    return false;
                }
                hi = slash != std::string::npos ? spec.max : lo;
            }
        }
        for (int v = lo; v <= hi; v += step) {
            *bits |= uint64_t(1) << v;
        }
    }
    if (*bits == 0) {
        *err = std::string("empty ") + spec.label + " field";
        return false;
    }
    return true;
}

static std::string expand_macro(const std::string &expr) {
    if (expr == "@yearly" || expr == "@annually") return "0 0 1 1 *";
    if (expr == "@monthly") return "0 0 1 * *";
    if (expr == "@weekly") return "0 0 * * 0";
    if (expr == "@daily" || expr == "@midnight") return "0 0 * * *";
    if (expr == "@hourly") return "0 * * * *";
    return expr;
}

bool parse_cron(const std::string &expr, CronSchedule *out, std::string *err) {
    std::string text = expand_macro(expr);
    if (!text.empty() && text[0] == '@') {
        *err = "unknown macro " + text;
        return false;
    }
    std::vector<std::string> fields;
    std::stringstream ss(text);
    std::string field;
    while (ss >> field) fields.push_back(field);
    if (fields.size() != 5) {
        *err = "expected 5 fields, got " + std::to_string(fields.size());
        return false;
    }

    static const FieldSpec specs[] = {
        {"minute", 0, 59, nullptr, 0, 0},
        {"hour", 0, 23, nullptr, 0, 0},
        {"day of month", 1, 31, nullptr, 0, 0},
        {"month", 1, 12, MONTH_NAMES, 12, 1},
        {"day of week", 0, 7, WEEKDAY_NAMES, 7, 0},
    };
    uint64_t bits[5];
    bool restricted[5];
    for (int i = 0; i < 5; i++) {
        if (!parse_field(fields[i], specs[i], &bits[i], &restricted[i], err)) {
            return false;
        }
    }
    CronSchedule s;
    s.minutes = bits[0];
    s.hours = static_cast<uint32_t>(bits[1]);
    s.days = static_cast<uint32_t>(bits[2]);
    s.months = static_cast<uint32_t>(bits[3]);
    // 7 is an alias for Sunday.
    uint64_t weekdays = bits[4];
    if (weekdays & (uint64_t(1) << 7)) weekdays |= 1;
    s.weekdays = static_cast<uint32_t>(weekdays & 0x7f);
    s.days_restricted = restricted[2];
    s.weekdays_restricted = restricted[4];
    *out = s;
    return true;
}

static bool day_matches(const CronSchedule &s, const struct tm &tm) {
    bool dom = (s.days >> tm.tm_mday) & 1;
    bool dow = (s.weekdays >> tm.tm_wday) & 1;
    if (s.days_restricted && s.weekdays_restricted) return dom || dow;
    return dom && dow;
}

bool cron_matches(const CronSchedule &schedule, const struct tm &tm) {
    return ((schedule.months >> (tm.tm_mon + 1)) & 1) &&
           day_matches(schedule, tm) &&
           ((schedule.hours >> tm.tm_hour) & 1) &&
           ((schedule.minutes >> tm.tm_min) & 1);
}

bool cron_next(const CronSchedule &schedule, std::time_t after, std::time_t *next) {
    struct tm tm;
    localtime_r(&after, &tm);
    tm.tm_sec = 0;
    tm.tm_min += 1;
    tm.tm_isdst = -1;
    std::time_t t = mktime(&tm);
    int limit_year = tm.tm_year + SEARCH_YEARS;

    while (tm.tm_year <= limit_year) {
        if (!((schedule.months >> (tm.tm_mon + 1)) & 1)) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
        } else if (!day_matches(schedule, tm)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
        } else if (!((schedule.hours >> tm.tm_hour) & 1)) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
        } else if (!((schedule.minutes >> tm.tm_min) & 1) || t <= after) {
            tm.tm_min += 1;
        } else {
            *next = t;
            return true;
        }
        tm.tm_sec = 0;
        tm.tm_isdst = -1;
        t = mktime(&tm);
    }
    return false;
}
