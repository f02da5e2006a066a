#include "lock.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

static pid_t read_pid(const std::string &path, bool *missing) {
    *missing = false;
    FILE *f = std::fopen(path.c_str(), "r");
    if (!f) {
        *missing = errno == ENOENT;
        return -1;
    }
    char buf[64] = {0};
    pid_t pid = 0;
    if (std::fgets(buf, sizeof(buf), f)) {
        pid = static_cast<pid_t>(std::atoi(buf));
    }
    std::fclose(f);
    return pid;
}

static bool pid_alive(pid_t pid) {
    if (pid <= 0) return false;
    char proc_path[128];
    std::snprintf(proc_path, sizeof(proc_path), "/proc/%d", static_cast<int>(pid));
    return access(proc_path, F_OK) == 0;
}

int lock_file(const std::string &path) {
    for (int attempt = 0; attempt < 3; attempt++) {
        int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
        if (fd >= 0) {
            char buf[32];
            int len = std::snprintf(buf, sizeof(buf), "%d\n", static_cast<int>(getpid()));
            if (len <= 0 || ::write(fd, buf, static_cast<size_t>(len)) != len) {
                ::close(fd);
                ::unlink(path.c_str());
                return -1;
            }
            ::close(fd);
            return 1;
        }
        if (errno != EEXIST) return -1;

        bool missing = false;
        pid_t pid = read_pid(path, &missing);
        if (missing) continue;
        if (pid < 0) return -1;
        if (pid_alive(pid)) return 0;

        // Stale lock left by a dead process.
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            return -1;
        }
    }
    return 0;
}

void unlock_file(const std::string &path) {
    bool missing = false;
    pid_t pid = read_pid(path, &missing);
    if (pid == getpid()) {
        ::unlink(path.c_str());
    }
}
