#ifndef RESTICD_RESTIC_ARGS_H
#define RESTICD_RESTIC_ARGS_H

#include "config.h"
#include "process.h"

#include <string>
#include <vector>

// Repository, password and cache flags for a location. The source form
// (from_repo) uses restic's --from-* flags and omits the cache directory.
bool location_arguments(const Config &cfg, const std::string &name, bool from_repo,
                        std::vector<std::string> *out, std::string *err);

bool execution_environment(const Config &cfg, const std::string &name, Environment *out, std::string *err);

std::vector<std::string> tag_arguments(const Config &cfg, const Profile &profile);
std::vector<std::string> hostname_arguments(const Profile &profile);

// Include/exclude flags from the global profile, the profile and the selected
// groups (all groups when none are selected). Plain includes come last.
bool inclusion_arguments(const Config &cfg, const Profile &profile, const std::vector<std::string> &groups,
                         std::vector<std::string> *out, std::string *err);

bool retention_arguments(const Policy &policy, std::vector<std::string> *out, std::string *err);

bool validate_two_repo_operation(const Config &cfg, const std::string &first, const std::string &second,
                                 std::string *err);

bool qualified_path(const std::string &path, bool must_exist, std::string *out, std::string *err);

#endif
