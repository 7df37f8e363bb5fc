#pragma once

namespace minirel::cli {

// Exit codes of minirel-inspect
// Named with MINIREL_ prefix to avoid conflict with system macros
constexpr int MINIREL_EXIT_SUCCESS = 0;
constexpr int MINIREL_EXIT_USAGE = 1;          // Invalid arguments, usage errors
constexpr int MINIREL_EXIT_STORAGE_ERROR = 2;  // File could not be opened or decoded

}  // namespace minirel::cli
