#include "cli.h"
#include "process.h"

#include <string>
#include <vector>

int main(int argc, char **argv) {
    install_signal_handlers();
    std::vector<std::string> args(argv + 1, argv + argc);
    return run_cli(args);
}
