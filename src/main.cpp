#include "launchpad/cli/commands.hpp"

int main(int argc, char **argv) { return launchpad::cli::run_cli(argc, argv); }
