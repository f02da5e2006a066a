#ifndef RESTICD_COMMANDS_H
#define RESTICD_COMMANDS_H

#include "config.h"
#include "output.h"

#include <string>
#include <vector>

static const int EXIT_FAILED = 1;
static const int EXIT_USAGE = 2;
static const int EXIT_LOCKED = 3;

// restic backup exits with 3 when some source files could not be read.
static const int RESTIC_INCOMPLETE = 3;

struct RunOptions {
    std::string profile;
    std::vector<std::string> groups;
    bool no_copy = false;
    // Replaces the policy locations and implies no_copy.
    std::vector<std::string> locations;
};

struct ArchiveOptions {
    std::string destination;
    std::string profile;
    std::vector<std::string> snapshots;
    std::string location;
    bool encrypt = false;
    std::string password_file;
};

int cmd_run(const Config &cfg, const RunMode &mode, const RunOptions &opts);
int cmd_init(const Config &cfg, const RunMode &mode, const std::string &location, const std::string &parent,
             const std::vector<std::string> &extra_args);
int cmd_execute(const Config &cfg, const RunMode &mode, const std::string &location,
                const std::vector<std::string> &args);
int cmd_command(const Config &cfg, const std::string &location);
int cmd_snapshots(const Config &cfg, const RunMode &mode, const std::string &profile, bool json,
                  const std::string &location);
int cmd_apply(const Config &cfg, const RunMode &mode, const std::string &profile, bool prune,
              const std::vector<std::string> &locations);
int cmd_prune(const Config &cfg, const RunMode &mode, const std::string &location);
int cmd_archive(const Config &cfg, const RunMode &mode, const ArchiveOptions &opts);
int cmd_decrypt(const Config &cfg, const std::string &input, const std::string &output,
                const std::string &password_file);
int cmd_list(const Config &cfg);
int cmd_copy(const Config &cfg, const RunMode &mode, const std::string &source, const std::string &destination,
             const std::vector<std::string> &snapshots);
int cmd_mount(const Config &cfg, const RunMode &mode, const std::string &profile, const std::string &mount_point,
              const std::string &location);

// Extracts the id from restic's "snapshot <id> saved" line.
bool parse_snapshot_id(const std::string &output, std::string *id);

// "2024-03-05T14:07:09.123456789+01:00" -> "20240305140709"
bool archive_timestamp(const std::string &restic_time, std::string *out);

#endif
