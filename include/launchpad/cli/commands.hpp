#pragma once

namespace launchpad::cli {

/// Entry point for the `launchpad` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace launchpad::cli
