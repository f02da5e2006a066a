#ifndef RESTICD_OUTPUT_H
#define RESTICD_OUTPUT_H

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

struct RunMode {
    bool dry_run = false;
    bool verbose = false;
};

void print_line(const std::string &msg);
void print_nested_line(const std::string &msg);
void print_warning(const std::string &msg);
void print_error(const std::string &msg);
void print_success(const std::string &msg);

std::string format_time(std::time_t t);
std::string human_readable(uint64_t bytes);

// Quote a single word for /bin/sh.
std::string shell_quote(const std::string &word);
std::string shell_join(const std::vector<std::string> &argv);

#endif
