#ifndef RESTICD_CLI_H
#define RESTICD_CLI_H

#include <string>
#include <vector>

// Parses the global options and the subcommand (argv without the program
// name), loads the config and runs the command. Returns the exit code.
int run_cli(const std::vector<std::string> &argv);

#endif
