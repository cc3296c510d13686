// =============================================================================
// pzkit - Command Support Implementation
// =============================================================================

#include "command_support.h"

#include <fmt/format.h>

#include <iostream>

#include "pzk/common/logger.h"

namespace pzk::commands {

int reportFailure(std::string_view action, const PZKException& e) {
    PZK_LOG_ERROR("{} failed: {}", action, e.what());
    if (!log::consoleEnabled()) {
        std::cerr << fmt::format("pzk: {} failed: {}\n", action, e.what());
    }
    return toExitCode(e.code());
}

}  // namespace pzk::commands
