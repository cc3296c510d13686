// =============================================================================
// pzkit - Checksum Command
// =============================================================================
// Command handler printing one or more digests for each input file.
//
// Output format, one line per file and digest:
//   <digest>  <kind>  <file>
// =============================================================================

#ifndef PZK_COMMANDS_CHECKSUM_COMMAND_H
#define PZK_COMMANDS_CHECKSUM_COMMAND_H

#include <filesystem>
#include <ostream>
#include <vector>

#include "pzk/chksum/checksum_engine.h"
#include "pzk/common/error.h"
#include "pzk/common/types.h"

namespace pzk::commands {

/// @brief Configuration options for the checksum command.
struct ChecksumOptions {
    /// @brief Files to checksum.
    std::vector<std::filesystem::path> inputPaths;

    /// @brief Digest kinds, in output order.
    std::vector<DigestKind> kinds = {DigestKind::kSha256};

    /// @brief Run digest groups on separate workers.
    bool parallel = true;
};

/// @brief Command handler for checksums.
class ChecksumCommand {
public:
    explicit ChecksumCommand(ChecksumOptions options, std::ostream& out);

    ~ChecksumCommand();

    // Non-copyable, non-movable (holds an output stream reference)
    ChecksumCommand(const ChecksumCommand&) = delete;
    ChecksumCommand& operator=(const ChecksumCommand&) = delete;

    /// @brief Execute the checksum command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ChecksumOptions& options() const noexcept { return options_; }

private:
    /// @brief Print the digests of one file in requested order.
    void printResult(const std::filesystem::path& path, const chksum::ChecksumResult& result);

    ChecksumOptions options_;
    std::ostream& out_;
};

}  // namespace pzk::commands

#endif  // PZK_COMMANDS_CHECKSUM_COMMAND_H
