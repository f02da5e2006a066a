#include "process.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

static volatile sig_atomic_t stop_flag = 0;
static volatile sig_atomic_t running_child = 0;

static void handle_signal(int signum) {
    stop_flag = 1;
    pid_t child = static_cast<pid_t>(running_child);
    if (child > 0) {
        kill(child, signum);
    }
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// SIGINT/SIGTERM stay blocked from fork() until running_child is set, so a
// stop arriving in between is still forwarded to the new child.
static void block_stop_signals(sigset_t *old) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigprocmask(SIG_BLOCK, &set, old);
}

static void restore_signals(const sigset_t &old) {
    sigprocmask(SIG_SETMASK, &old, nullptr);
}

bool stop_requested() {
    return stop_flag != 0;
}

void clear_stop_request() {
    stop_flag = 0;
}

Environment current_environment() {
    Environment env;
    for (char **p = environ; p && *p; p++) {
        const char *eq = std::strchr(*p, '=');
        if (!eq) continue;
        env[std::string(*p, static_cast<size_t>(eq - *p))] = eq + 1;
    }
    return env;
}

bool find_in_path(const std::string &name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }
    const char *path = getenv("PATH");
    if (!path) return false;
    std::string dirs = path;
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

// Pointers into the strings must stay valid until exec.
struct ExecArgs {
    std::vector<std::string> env_strings;
    std::vector<char *> argv;
    std::vector<char *> envp;
};

static void build_exec_args(const std::vector<std::string> &argv, const Environment *env, ExecArgs *out) {
    for (const auto &s : argv) {
        out->argv.push_back(const_cast<char *>(s.c_str()));
    }
    out->argv.push_back(nullptr);
    if (env) {
        for (const auto &kv : *env) {
            out->env_strings.push_back(kv.first + "=" + kv.second);
        }
        for (const auto &s : out->env_strings) {
            out->envp.push_back(const_cast<char *>(s.c_str()));
        }
        out->envp.push_back(nullptr);
    }
}

static void exec_child(ExecArgs &args, bool has_env, const sigset_t &mask) {
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    restore_signals(mask);
    if (has_env) {
        execvpe(args.argv[0], args.argv.data(), args.envp.data());
    } else {
        execvp(args.argv[0], args.argv.data());
    }
    std::fprintf(stderr, "exec %s: %s\n", args.argv[0], std::strerror(errno));
    _exit(127);
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

int run_command(const std::vector<std::string> &argv, const CommandOptions &opts, std::string *output) {
    if (argv.empty()) return -1;
    ExecArgs args;
    build_exec_args(argv, opts.env, &args);

    bool piped = opts.output != OutputMode::Inherit;
    int fds[2] = {-1, -1};
    if (piped && pipe(fds) != 0) return -1;

    std::fflush(stdout);
    std::fflush(stderr);
    sigset_t old_mask;
    block_stop_signals(&old_mask);
    pid_t pid = fork();
    if (pid < 0) {
        restore_signals(old_mask);
        if (piped) {
            close(fds[0]);
            close(fds[1]);
        }
        return -1;
    }
    if (pid == 0) {
        if (opts.polite) {
            setpriority(PRIO_PROCESS, 0, 19);
        }
        if (piped) {
            dup2(fds[1], STDOUT_FILENO);
            close(fds[0]);
            close(fds[1]);
        }
        exec_child(args, opts.env != nullptr, old_mask);
    }
    running_child = pid;
    restore_signals(old_mask);

    if (piped) {
        close(fds[1]);
        char buf[4096];
        for (;;) {
            ssize_t n = read(fds[0], buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            if (opts.output == OutputMode::Tee) {
                std::fwrite(buf, 1, static_cast<size_t>(n), stdout);
                std::fflush(stdout);
            }
            if (output) output->append(buf, static_cast<size_t>(n));
        }
        close(fds[0]);
    }

    int rc = wait_child(pid);
    running_child = 0;
    return rc;
}

static int open_redirect(const std::string &path, bool for_output, std::string *err) {
    int fd = for_output ? ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600)
                        : ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        *err = "open " + path + ": " + std::strerror(errno);
    }
    return fd;
}

int run_pipeline(const std::vector<PipelineStage> &stages, const std::string &input_path,
                 const std::string &output_path, std::string *err) {
    if (stages.empty()) {
        *err = "empty pipeline";
        return -1;
    }
    int in_fd = -1;
    int out_fd = -1;
    if (!input_path.empty() && input_path != "-") {
        in_fd = open_redirect(input_path, false, err);
        if (in_fd < 0) return -1;
    }
    if (!output_path.empty() && output_path != "-") {
        out_fd = open_redirect(output_path, true, err);
        if (out_fd < 0) {
            if (in_fd >= 0) close(in_fd);
            return -1;
        }
    }

    std::vector<ExecArgs> args(stages.size());
    for (size_t i = 0; i < stages.size(); i++) {
        build_exec_args(stages[i].argv, stages[i].env, &args[i]);
    }

    std::fflush(stdout);
    std::fflush(stderr);
    std::vector<pid_t> pids;
    int prev_read = in_fd;
    bool failed = false;
    for (size_t i = 0; i < stages.size(); i++) {
        bool last = i + 1 == stages.size();
        int fds[2] = {-1, -1};
        if (!last && pipe2(fds, O_CLOEXEC) != 0) {
            *err = std::string("pipe: ") + std::strerror(errno);
            failed = true;
            break;
        }
        sigset_t old_mask;
        block_stop_signals(&old_mask);
        pid_t pid = fork();
        if (pid < 0) {
            restore_signals(old_mask);
            *err = std::string("fork: ") + std::strerror(errno);
            if (!last) {
                close(fds[0]);
                close(fds[1]);
            }
            failed = true;
            break;
        }
        if (pid == 0) {
            if (prev_read >= 0) dup2(prev_read, STDIN_FILENO);
            if (!last) {
                dup2(fds[1], STDOUT_FILENO);
            } else if (out_fd >= 0) {
                dup2(out_fd, STDOUT_FILENO);
            }
            exec_child(args[i], stages[i].env != nullptr, old_mask);
        }
        running_child = pid;
        restore_signals(old_mask);
        pids.push_back(pid);
        if (prev_read >= 0) close(prev_read);
        prev_read = -1;
        if (!last) {
            close(fds[1]);
            prev_read = fds[0];
        }
    }
    if (prev_read >= 0) close(prev_read);
    if (out_fd >= 0) close(out_fd);

    int rc = 0;
    for (pid_t pid : pids) {
        running_child = pid;
        int stage_rc = wait_child(pid);
        if (rc == 0 && stage_rc != 0) rc = stage_rc;
    }
    running_child = 0;
    if (failed) return -1;
    return rc;
}
