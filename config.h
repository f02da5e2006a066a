#ifndef RESTICD_CONFIG_H
#define RESTICD_CONFIG_H

#include <map>
#include <string>
#include <vector>

static const int CONFIG_VERSION = 1;
static const size_t NAME_MAX_LENGTH = 63;

struct Location {
    std::string path;
    std::string password_file;
    std::string password_command;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> clean_env;
    bool has_clean_env = false;
};

// A value of -1 means the rule is not set.
struct Retention {
    int keep_last = -1;
    std::string keep_within;
    int keep_hourly = -1;
    int keep_daily = -1;
    int keep_weekly = -1;
    int keep_monthly = -1;
    int keep_yearly = -1;
};

struct Policy {
    std::vector<std::string> locations;
    std::string schedule;
    Retention retention;
    bool has_retention = false;
};

struct SourceDef {
    std::vector<std::string> include;
    std::vector<std::string> include_files_from;
    std::vector<std::string> include_files_from_verbatim;
    std::vector<std::string> exclude;
    std::vector<std::string> iexclude;
    std::vector<std::string> exclude_if_present;
    std::vector<std::string> exclude_file;
    std::vector<std::string> iexclude_file;
    bool exclude_caches = false;
    std::string exclude_larger_than;
};

struct Profile {
    std::string id;
    std::string policy;
    std::string hostname;
    std::string archive_name;
    std::vector<std::string> tags;
    std::vector<std::string> args;
    bool auto_apply = false;
    SourceDef source;
    // Ordered by name.
    std::map<std::string, SourceDef> groups;
};

struct ArchiveConfig {
    std::string cache;
    std::string password_file;
};

struct DaemonConfig {
    int retries = 0;
    int retry_delay = 60;
};

struct Config {
    int version = CONFIG_VERSION;
    std::string cache;
    std::string restic = "restic";
    std::string lock_file;
    std::map<std::string, Location> locations;
    std::map<std::string, Policy> policies;
    std::map<std::string, Profile> profiles;
    Profile global_profile;
    bool has_global_profile = false;
    ArchiveConfig archive;
    bool has_archive = false;
    DaemonConfig daemon;
};

std::string default_config_path();
std::string expand_user(const std::string &path);

bool is_valid_name(const std::string &name, std::string *err);
bool parse_config(const std::string &path, Config *cfg, std::string *err);
bool parse_config_string(const std::string &text, Config *cfg, std::string *err);

const Location *find_location(const Config &cfg, const std::string &name, std::string *err);
const Policy *find_policy(const Config &cfg, const std::string &name, std::string *err);
const Profile *find_profile(const Config &cfg, const std::string &name, std::string *err);
const Policy *profile_policy(const Config &cfg, const std::string &profile_name, std::string *err);

#endif
