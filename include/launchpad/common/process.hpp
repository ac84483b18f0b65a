#pragma once

#include "launchpad/common/result.hpp"

#include <string>
#include <vector>

namespace launchpad::common {

struct CommandOutput {
  int exit_code = 0;
  std::string stdout_text;
};

/// Run `argv` (argv[0] resolved through PATH) and capture its standard output. Standard error
/// is discarded. Blocks until the child exits.
[[nodiscard]] Result<CommandOutput> run_capture(const std::vector<std::string> &argv);

[[nodiscard]] bool command_exists(const std::string &command);

} // namespace launchpad::common
