#include "output.h"

#include <cstdio>
#include <unistd.h>

static const char *COLOR_YELLOW = "\033[33m";
static const char *COLOR_RED = "\033[31m";
static const char *COLOR_GREEN = "\033[32m";
static const char *COLOR_RESET = "\033[0m";

static void print_colored(FILE *f, const char *color, const std::string &prefix, const std::string &msg) {
    if (isatty(fileno(f))) {
        std::fprintf(f, "%s%s%s%s\n", prefix.c_str(), color, msg.c_str(), COLOR_RESET);
    } else {
        std::fprintf(f, "%s%s\n", prefix.c_str(), msg.c_str());
    }
    std::fflush(f);
}

void print_line(const std::string &msg) {
    std::printf("-------- %s\n", msg.c_str());
    std::fflush(stdout);
}

void print_nested_line(const std::string &msg) {
    std::printf("------------ %s\n", msg.c_str());
    std::fflush(stdout);
}

void print_warning(const std::string &msg) {
    std::fflush(stdout);
    print_colored(stderr, COLOR_YELLOW, "-------- ", msg);
}

void print_error(const std::string &msg) {
    std::fflush(stdout);
    print_colored(stderr, COLOR_RED, "-------- ", msg);
}

void print_success(const std::string &msg) {
    print_colored(stdout, COLOR_GREEN, "------------ ", msg);
}

std::string format_time(std::time_t t) {
    struct tm tm;
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string human_readable(uint64_t bytes) {
    static const char *units[] = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    if (bytes == 1) return "1 Byte";
    if (bytes < 1024) return std::to_string(bytes) + " Bytes";
    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        unit++;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

std::string shell_quote(const std::string &word) {
    if (word.empty()) return "''";
    bool safe = true;
    for (char c : word) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!ok) {
            switch (c) {
                case '@': case '%': case '+': case '=': case ':':
                case ',': case '.': case '/': case '-': case '_':
                    ok = true;
                    break;
                default:
                    break;
            }
        }
        if (!ok) {
            safe = false;
            break;
        }
    }
    if (safe) return word;
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string> &argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) out += " ";
        out += shell_quote(argv[i]);
    }
    return out;
}
