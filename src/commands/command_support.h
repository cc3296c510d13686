// =============================================================================
// pzkit - Command Support
// =============================================================================
// Helpers shared by the command handlers.
// =============================================================================

#ifndef PZK_COMMANDS_COMMAND_SUPPORT_H
#define PZK_COMMANDS_COMMAND_SUPPORT_H

#include <string_view>

#include "pzk/common/error.h"

namespace pzk::commands {

/// @brief Report a failed command and map it to an exit code.
/// @note Logs the error. When no log record reaches the console, the message
///       is also written to stderr so the user still sees it.
/// @param action Short name of what failed (e.g., "Compression").
/// @return Exit code for the exception's error code.
[[nodiscard]] int reportFailure(std::string_view action, const PZKException& e);

}  // namespace pzk::commands

#endif  // PZK_COMMANDS_COMMAND_SUPPORT_H
