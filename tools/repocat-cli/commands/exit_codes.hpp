#pragma once

namespace repocat::cli {

// Standard exit codes for CLI commands
// Named with REPOCAT_ prefix to avoid conflict with system macros
constexpr int REPOCAT_EXIT_SUCCESS = 0;
constexpr int REPOCAT_EXIT_USER_ERROR = 1;     // Invalid arguments, bad config
constexpr int REPOCAT_EXIT_NOT_FOUND = 2;      // Root or config file missing
constexpr int REPOCAT_EXIT_IO_ERROR = 3;       // Scan or write failure
constexpr int REPOCAT_EXIT_INTERNAL = 4;       // Internal/unexpected errors

}  // namespace repocat::cli
