#include "config.h"

#include "cron.h"
#include "output.h"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

std::string default_config_path() {
    const char *env = getenv("RESTICD_CONFIG");
    if (env && env[0] != '\0') return env;
    return "~/.resticd.yaml";
}

std::string expand_user(const std::string &path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char *home = getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

static bool is_name_char(char c, bool allow_underscore) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= '0' && c <= '9') return true;
    return allow_underscore && c == '_';
}

bool is_valid_name(const std::string &name, std::string *err) {
    bool ok = !name.empty();
    for (size_t i = 0; ok && i < name.size(); i++) {
        bool edge = i == 0 || i + 1 == name.size();
        ok = is_name_char(name[i], !edge);
    }
    if (!ok) {
        *err = "'" + name + "' does not conform to ^[a-z0-9]([_a-z0-9]*[a-z0-9])?$";
        return false;
    }
    if (name.size() > NAME_MAX_LENGTH) {
        *err = "'" + name + "' is more than " + std::to_string(NAME_MAX_LENGTH) + " characters";
        return false;
    }
    return true;
}

static std::vector<std::string> read_string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (!node || node.IsNull()) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    for (const auto &item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

static bool read_string_map(const YAML::Node &node, std::map<std::string, std::string> *out, std::string *err) {
    if (!node || node.IsNull()) return true;
    if (!node.IsMap()) {
        *err = "expected a mapping of names to values";
        return false;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        (*out)[it->first.as<std::string>()] = it->second.as<std::string>("");
    }
    return true;
}

static void parse_source(const YAML::Node &node, SourceDef *src) {
    src->include = read_string_list(node["include"]);
    src->include_files_from = read_string_list(node["include_files_from"]);
    src->include_files_from_verbatim = read_string_list(node["include_files_from_verbatim"]);
    src->exclude = read_string_list(node["exclude"]);
    src->iexclude = read_string_list(node["iexclude"]);
    src->exclude_if_present = read_string_list(node["exclude_if_present"]);
    src->exclude_file = read_string_list(node["exclude_file"]);
    src->iexclude_file = read_string_list(node["iexclude_file"]);
    src->exclude_caches = node["exclude_caches"].as<bool>(false);
    src->exclude_larger_than = node["exclude_larger_than"].as<std::string>("");
}

static bool parse_profile(const YAML::Node &node, Profile *profile, std::string *err) {
    if (!node.IsMap()) {
        *err = "expected a mapping";
        return false;
    }
    profile->id = node["id"].as<std::string>("");
    if (!profile->id.empty() && !is_valid_name(profile->id, err)) {
        *err = "id " + *err;
        return false;
    }
    profile->policy = node["policy"].as<std::string>("");
    profile->hostname = node["hostname"].as<std::string>("");
    profile->archive_name = node["archive_name"].as<std::string>("");
    profile->tags = read_string_list(node["tags"]);
    profile->args = read_string_list(node["args"]);
    profile->auto_apply = node["auto_apply"].as<bool>(false);
    parse_source(node, &profile->source);
    const YAML::Node groups = node["groups"];
    if (groups && !groups.IsNull()) {
        if (!groups.IsMap()) {
            *err = "groups must be a mapping";
            return false;
        }
        for (auto it = groups.begin(); it != groups.end(); ++it) {
            SourceDef group;
            parse_source(it->second, &group);
            profile->groups[it->first.as<std::string>()] = group;
        }
    }
    return true;
}

static bool parse_retention(const YAML::Node &node, Retention *r) {
    if (!node || node.IsNull()) return false;
    r->keep_last = node["keep_last"].as<int>(-1);
    r->keep_within = node["keep_within"].as<std::string>("");
    r->keep_hourly = node["keep_hourly"].as<int>(-1);
    r->keep_daily = node["keep_daily"].as<int>(-1);
    r->keep_weekly = node["keep_weekly"].as<int>(-1);
    r->keep_monthly = node["keep_monthly"].as<int>(-1);
    r->keep_yearly = node["keep_yearly"].as<int>(-1);
    return true;
}

static bool require_named_map(const YAML::Node &root, const char *key, std::string *err) {
    const YAML::Node node = root[key];
    if (!node || !node.IsMap()) {
        *err = std::string("missing ") + key;
        return false;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!is_valid_name(it->first.as<std::string>(), err)) {
            *err = std::string(key) + ": " + *err;
            return false;
        }
    }
    return true;
}

static bool has_retention_rules(const Policy &policy) {
    if (!policy.has_retention) return false;
    const Retention &r = policy.retention;
    return r.keep_last >= 0 || !r.keep_within.empty() || r.keep_hourly >= 0 || r.keep_daily >= 0 ||
           r.keep_weekly >= 0 || r.keep_monthly >= 0 || r.keep_yearly >= 0;
}

static bool validate_config(const Config &cfg, std::string *err) {
    for (const auto &entry : cfg.policies) {
        const Policy &policy = entry.second;
        if (policy.locations.empty()) {
            *err = "policy " + entry.first + ": no location defined";
            return false;
        }
        for (const auto &loc : policy.locations) {
            if (cfg.locations.find(loc) == cfg.locations.end()) {
                *err = "policy " + entry.first + ": location " + loc + " not found";
                return false;
            }
        }
        if (!policy.schedule.empty()) {
            CronSchedule schedule;
            if (!parse_cron(policy.schedule, &schedule, err)) {
                *err = "policy " + entry.first + ": invalid schedule: " + *err;
                return false;
            }
        }
    }
    for (const auto &entry : cfg.profiles) {
        const Profile &profile = entry.second;
        auto policy = cfg.policies.find(profile.policy);
        if (!profile.policy.empty() && policy == cfg.policies.end()) {
            *err = "profile " + entry.first + ": policy " + profile.policy + " not found";
            return false;
        }
        if (profile.auto_apply && (policy == cfg.policies.end() || !has_retention_rules(policy->second))) {
            *err = "profile " + entry.first + ": auto_apply requires a policy with retention rules";
            return false;
        }
    }
    return true;
}

static bool load_root(const YAML::Node &root, Config *cfg, std::string *err) {
    if (!root.IsMap()) {
        *err = "top level must be a mapping";
        return false;
    }
    cfg->version = root["v"].as<int>(CONFIG_VERSION);
    cfg->cache = expand_user(root["cache"].as<std::string>(""));
    cfg->restic = root["restic"].as<std::string>("restic");
    cfg->lock_file = expand_user(root["lock_file"].as<std::string>(""));

    if (!require_named_map(root, "locations", err) ||
        !require_named_map(root, "policies", err) ||
        !require_named_map(root, "profiles", err)) {
        return false;
    }

    const YAML::Node locations = root["locations"];
    for (auto it = locations.begin(); it != locations.end(); ++it) {
        std::string name = it->first.as<std::string>();
        const YAML::Node node = it->second;
        Location loc;
        loc.path = node["path"].as<std::string>("");
        if (loc.path.empty()) {
            *err = "location " + name + ": path is required";
            return false;
        }
        loc.password_file = node["password_file"].as<std::string>("");
        loc.password_command = node["password_command"].as<std::string>("");
        if (!read_string_map(node["env"], &loc.env, err) ||
            !read_string_map(node["clean_env"], &loc.clean_env, err)) {
            *err = "location " + name + ": " + *err;
            return false;
        }
        loc.has_clean_env = node["clean_env"] && !node["clean_env"].IsNull();
        cfg->locations[name] = loc;
    }

    const YAML::Node policies = root["policies"];
    for (auto it = policies.begin(); it != policies.end(); ++it) {
        std::string name = it->first.as<std::string>();
        const YAML::Node node = it->second;
        Policy policy;
        policy.locations = read_string_list(node["location"]);
        policy.schedule = node["schedule"].as<std::string>("");
        policy.has_retention = parse_retention(node["retention"], &policy.retention);
        cfg->policies[name] = policy;
    }

    const YAML::Node profiles = root["profiles"];
    for (auto it = profiles.begin(); it != profiles.end(); ++it) {
        std::string name = it->first.as<std::string>();
        Profile profile;
        if (!parse_profile(it->second, &profile, err)) {
            *err = "profile " + name + ": " + *err;
            return false;
        }
        cfg->profiles[name] = profile;
    }

    const YAML::Node global = root["global_profile"];
    if (global && !global.IsNull()) {
        if (!parse_profile(global, &cfg->global_profile, err)) {
            *err = "global_profile: " + *err;
            return false;
        }
        cfg->has_global_profile = true;
    }

    const YAML::Node archive = root["archive"];
    if (archive && !archive.IsNull()) {
        cfg->archive.cache = archive["cache"].as<std::string>("");
        cfg->archive.password_file = archive["password_file"].as<std::string>("");
        cfg->has_archive = true;
    }

    const YAML::Node daemon = root["daemon"];
    if (daemon && !daemon.IsNull()) {
        cfg->daemon.retries = daemon["retries"].as<int>(0);
        cfg->daemon.retry_delay = daemon["retry_delay"].as<int>(60);
        if (cfg->daemon.retries < 0 || cfg->daemon.retry_delay < 0) {
            *err = "daemon: retries and retry_delay must not be negative";
            return false;
        }
    }

    return validate_config(*cfg, err);
}

bool parse_config(const std::string &path, Config *cfg, std::string *err) {
    try {
        YAML::Node root = YAML::LoadFile(expand_user(path));
        if (!load_root(root, cfg, err)) return false;
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
    if (cfg->version < CONFIG_VERSION) {
        print_warning("Warning: config file at \"" + path + "\" is possibly incompatible with this version. "
                      "Check its contents and set \"v\" to " + std::to_string(CONFIG_VERSION) + ".");
    }
    return true;
}

bool parse_config_string(const std::string &text, Config *cfg, std::string *err) {
    try {
        return load_root(YAML::Load(text), cfg, err);
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
}

const Location *find_location(const Config &cfg, const std::string &name, std::string *err) {
    auto it = cfg.locations.find(name);
    if (it == cfg.locations.end()) {
        *err = "no backup location '" + name + "' defined in config";
        return nullptr;
    }
    return &it->second;
}

const Policy *find_policy(const Config &cfg, const std::string &name, std::string *err) {
    auto it = cfg.policies.find(name);
    if (it == cfg.policies.end()) {
        *err = "no backup policy '" + name + "' defined in config";
        return nullptr;
    }
    return &it->second;
}

const Profile *find_profile(const Config &cfg, const std::string &name, std::string *err) {
    auto it = cfg.profiles.find(name);
    if (it == cfg.profiles.end()) {
        *err = "no backup profile '" + name + "' defined in config";
        return nullptr;
    }
    return &it->second;
}

const Policy *profile_policy(const Config &cfg, const std::string &profile_name, std::string *err) {
    const Profile *profile = find_profile(cfg, profile_name, err);
    if (!profile) return nullptr;
    if (profile->policy.empty()) {
        *err = "no policy defined for profile '" + profile_name + "'";
        return nullptr;
    }
    return find_policy(cfg, profile->policy, err);
}
