#include "restic_args.h"

#include "output.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <unistd.h>

bool qualified_path(const std::string &path, bool must_exist, std::string *out, std::string *err) {
    std::string full = expand_user(path);
    if (full.empty() || full[0] != '/') {
        char cwd[PATH_MAX];
        if (!getcwd(cwd, sizeof(cwd))) {
            *err = std::string("getcwd: ") + std::strerror(errno);
            return false;
        }
        full = std::string(cwd) + "/" + full;
    }
    if (must_exist && access(full.c_str(), F_OK) != 0) {
        *err = "file path '" + full + "' (from '" + path + "') does not exist";
        return false;
    }
    *out = full;
    return true;
}

bool location_arguments(const Config &cfg, const std::string &name, bool from_repo,
                        std::vector<std::string> *out, std::string *err) {
    const Location *loc = find_location(cfg, name, err);
    if (!loc) return false;

    if (!from_repo && !cfg.cache.empty()) {
        out->push_back("--cache-dir");
        out->push_back(cfg.cache);
    }

    if (!loc->password_file.empty()) {
        std::string path;
        if (!qualified_path(loc->password_file, true, &path, err)) return false;
        out->push_back(from_repo ? "--from-password-file" : "--password-file");
        out->push_back(path);
    } else if (!loc->password_command.empty()) {
        out->push_back(from_repo ? "--from-password-command" : "--password-command");
        out->push_back(loc->password_command);
    } else {
        print_warning("Warning: no password_file or password_command defined for backup location '" + name + "'");
    }

    out->push_back(from_repo ? "--from-repo" : "--repo");
    out->push_back(loc->path);
    return true;
}

bool execution_environment(const Config &cfg, const std::string &name, Environment *out, std::string *err) {
    const Location *loc = find_location(cfg, name, err);
    if (!loc) return false;
    if (loc->has_clean_env) {
        *out = loc->clean_env;
        return true;
    }
    *out = current_environment();
    for (const auto &kv : loc->env) {
        (*out)[kv.first] = kv.second;
    }
    return true;
}

static void append_unique(std::vector<std::string> *list, const std::vector<std::string> &items) {
    for (const auto &item : items) {
        if (std::find(list->begin(), list->end(), item) == list->end()) {
            list->push_back(item);
        }
    }
}

std::vector<std::string> tag_arguments(const Config &cfg, const Profile &profile) {
    std::vector<std::string> tags;
    if (cfg.has_global_profile) append_unique(&tags, cfg.global_profile.tags);
    append_unique(&tags, profile.tags);
    if (tags.empty()) return {};
    std::string joined;
    for (size_t i = 0; i < tags.size(); i++) {
        if (i > 0) joined += ",";
        joined += tags[i];
    }
    return {"--tag", joined};
}

std::vector<std::string> hostname_arguments(const Profile &profile) {
    if (profile.hostname.empty()) return {};
    return {"--host", profile.hostname};
}

static bool append_flag_paths(const char *flag, const std::vector<std::string> &paths,
                              std::vector<std::string> *out, std::string *err) {
    for (const auto &entry : paths) {
        std::string path;
        if (!qualified_path(entry, true, &path, err)) return false;
        out->push_back(flag);
        out->push_back(path);
    }
    return true;
}

static void append_flag_values(const char *flag, const std::vector<std::string> &values,
                               std::vector<std::string> *out) {
    for (const auto &value : values) {
        out->push_back(flag);
        out->push_back(value);
    }
}

bool inclusion_arguments(const Config &cfg, const Profile &profile, const std::vector<std::string> &groups,
                         std::vector<std::string> *out, std::string *err) {
    std::vector<const SourceDef *> sources;
    if (cfg.has_global_profile) sources.push_back(&cfg.global_profile.source);
    sources.push_back(&profile.source);
    if (groups.empty()) {
        for (const auto &entry : profile.groups) {
            sources.push_back(&entry.second);
        }
    } else {
        for (const auto &name : groups) {
            auto it = profile.groups.find(name);
            if (it == profile.groups.end()) {
                *err = "no group '" + name + "' defined in profile";
                return false;
            }
            sources.push_back(&it->second);
        }
    }

    std::vector<std::string> includes;
    for (const SourceDef *src : sources) {
        includes.insert(includes.end(), src->include.begin(), src->include.end());
        if (!append_flag_paths("--files-from", src->include_files_from, out, err) ||
            !append_flag_paths("--files-from-verbatim", src->include_files_from_verbatim, out, err)) {
            return false;
        }
        append_flag_values("--exclude", src->exclude, out);
        append_flag_values("--iexclude", src->iexclude, out);
        append_flag_values("--exclude-if-present", src->exclude_if_present, out);
        if (!append_flag_paths("--exclude-file", src->exclude_file, out, err) ||
            !append_flag_paths("--iexclude-file", src->iexclude_file, out, err)) {
            return false;
        }
        if (src->exclude_caches) {
            out->push_back("--exclude-caches");
        }
        if (!src->exclude_larger_than.empty()) {
            out->push_back("--exclude-larger-than");
            out->push_back(src->exclude_larger_than);
        }
    }
    out->insert(out->end(), includes.begin(), includes.end());
    return true;
}

static void append_keep(const char *flag, int value, std::vector<std::string> *out) {
    if (value < 0) return;
    out->push_back(flag);
    out->push_back(std::to_string(value));
}

bool retention_arguments(const Policy &policy, std::vector<std::string> *out, std::string *err) {
    const Retention &r = policy.retention;
    size_t before = out->size();
    if (policy.has_retention) {
        append_keep("--keep-last", r.keep_last, out);
        if (!r.keep_within.empty()) {
            out->push_back("--keep-within");
            out->push_back(r.keep_within);
        }
        append_keep("--keep-hourly", r.keep_hourly, out);
        append_keep("--keep-daily", r.keep_daily, out);
        append_keep("--keep-weekly", r.keep_weekly, out);
        append_keep("--keep-monthly", r.keep_monthly, out);
        append_keep("--keep-yearly", r.keep_yearly, out);
    }
    if (out->size() == before) {
        *err = "policy has no retention rules";
        return false;
    }
    return true;
}

static const Environment &location_overrides(const Location &loc) {
    return loc.has_clean_env ? loc.clean_env : loc.env;
}

bool validate_two_repo_operation(const Config &cfg, const std::string &first, const std::string &second,
                                 std::string *err) {
    const Location *a = find_location(cfg, first, err);
    if (!a) return false;
    const Location *b = find_location(cfg, second, err);
    if (!b) return false;
    if (first == second) {
        *err = "source and destination are the same location '" + first + "'";
        return false;
    }
    if (a->path == b->path) {
        *err = "locations '" + first + "' and '" + second + "' point at the same repository " + a->path;
        return false;
    }
    const Environment &env_a = location_overrides(*a);
    const Environment &env_b = location_overrides(*b);
    for (const auto &kv : env_a) {
        auto it = env_b.find(kv.first);
        if (it != env_b.end() && it->second != kv.second) {
            *err = "locations '" + first + "' and '" + second + "' set conflicting values for " + kv.first;
            return false;
        }
    }
    return true;
}
