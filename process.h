#ifndef RESTICD_PROCESS_H
#define RESTICD_PROCESS_H

#include <map>
#include <string>
#include <vector>

typedef std::map<std::string, std::string> Environment;

enum class OutputMode {
    Inherit,
    Tee,
    Capture
};

struct CommandOptions {
    // nullptr inherits the environment of this process.
    const Environment *env = nullptr;
    // Run the child at the lowest CPU priority.
    bool polite = false;
    OutputMode output = OutputMode::Inherit;
};

struct PipelineStage {
    std::vector<std::string> argv;
    const Environment *env = nullptr;
};

// Runs argv and waits for it. Returns the exit status, 128 + signal when the
// child was killed, 127 when it could not be executed and -1 when it could not
// be started. Captured stdout is appended to *output when given.
int run_command(const std::vector<std::string> &argv, const CommandOptions &opts, std::string *output = nullptr);

// Connects the stages with pipes. An empty input or output path, or "-",
// keeps this process's stdin/stdout. Returns the first non-zero stage status
// or -1 with *err set when the pipeline could not be set up.
int run_pipeline(const std::vector<PipelineStage> &stages, const std::string &input_path,
                 const std::string &output_path, std::string *err);

Environment current_environment();
bool find_in_path(const std::string &name);

// SIGINT/SIGTERM set the stop flag and are forwarded to the running child.
void install_signal_handlers();
bool stop_requested();
void clear_stop_request();

#endif
