// =============================================================================
// pzkit - Checksum Command Implementation
// =============================================================================

#include "checksum_command.h"

#include <fmt/format.h>

#include "command_support.h"
#include "pzk/chksum/data_source.h"
#include "pzk/chksum/digest_registry.h"
#include "pzk/common/logger.h"

namespace pzk::commands {

ChecksumCommand::ChecksumCommand(ChecksumOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

ChecksumCommand::~ChecksumCommand() = default;

int ChecksumCommand::execute() {
    try {
        if (options_.inputPaths.empty()) {
            throw UsageError("No input files given");
        }
        if (options_.kinds.empty()) {
            throw UsageError("No digest kinds given");
        }

        chksum::ChecksumEngineConfig config;
        config.parallelize = options_.parallel;
        const chksum::ChecksumEngine engine(config);

        // Unsupported kinds fail here, before any file is read
        const auto executionPlan = engine.plan(options_.kinds);
        PZK_LOG_DEBUG("{} digest group(s), parallel={}", executionPlan.groups.size(),
                      executionPlan.parallel);

        for (const auto& path : options_.inputPaths) {
            const chksum::FileDataSource source(path);
            printResult(path, engine.compute(source, options_.kinds));
        }
        out_.flush();
        return 0;

    } catch (const PZKException& e) {
        return reportFailure("Checksum", e);
    }
}

void ChecksumCommand::printResult(const std::filesystem::path& path,
                                  const chksum::ChecksumResult& result) {
    for (DigestKind kind : options_.kinds) {
        auto it = result.find(kind);
        if (it == result.end()) {
            continue;
        }
        out_ << fmt::format("{}  {}  {}\n", chksum::formatDigest(kind, it->second),
                            digestName(kind), path.string());
    }
}

}  // namespace pzk::commands
