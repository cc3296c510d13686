// =============================================================================
// pzkit - Info Command
// =============================================================================
// Command handler reporting what this host offers: core topology, installed
// codec tools ranked per codec, and the digest implementation chosen per kind.
// =============================================================================

#ifndef PZK_COMMANDS_INFO_COMMAND_H
#define PZK_COMMANDS_INFO_COMMAND_H

#include <ostream>
#include <string>
#include <string_view>

#include "pzk/chksum/digest_registry.h"
#include "pzk/codec/backend_registry.h"
#include "pzk/common/cpu_topology.h"
#include "pzk/common/error.h"

namespace pzk::commands {

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Output as JSON.
    bool jsonOutput = false;
};

/// @brief Command handler for host capability information.
class InfoCommand {
public:
    /// @brief Construct over explicit registries (tests) or the process-wide ones.
    InfoCommand(InfoOptions options, std::ostream& out,
                const codec::BackendRegistry& backends = codec::BackendRegistry::instance(),
                const chksum::DigestRegistry& digests = chksum::DigestRegistry::instance());

    ~InfoCommand();

    // Non-copyable, non-movable (holds references)
    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printTextInfo(const CpuTopology& topology);
    void printJsonInfo(const CpuTopology& topology);

    InfoOptions options_;
    std::ostream& out_;
    const codec::BackendRegistry& backends_;
    const chksum::DigestRegistry& digests_;
};

/// @brief Escape a string for a JSON string literal.
[[nodiscard]] std::string jsonEscape(std::string_view text);

}  // namespace pzk::commands

#endif  // PZK_COMMANDS_INFO_COMMAND_H
