#pragma once

namespace folio::cli {

// Standard exit codes for CLI commands
// Named with FOLIO_ prefix to avoid conflict with system macros
constexpr int FOLIO_EXIT_SUCCESS = 0;
constexpr int FOLIO_EXIT_USER_ERROR = 1;     // Invalid arguments or geometry, rejected documents
constexpr int FOLIO_EXIT_NOT_FOUND = 2;      // Document not stored
constexpr int FOLIO_EXIT_STORAGE_ERROR = 3;  // File and corruption errors

}  // namespace folio::cli
