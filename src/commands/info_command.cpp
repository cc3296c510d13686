// =============================================================================
// pzkit - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <fmt/format.h>

#include "command_support.h"
#include "pzk/common/logger.h"

namespace pzk::commands {

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options, std::ostream& out,
                         const codec::BackendRegistry& backends,
                         const chksum::DigestRegistry& digests)
    : options_(options), out_(out), backends_(backends), digests_(digests) {}

InfoCommand::~InfoCommand() = default;

int InfoCommand::execute() {
    try {
        const CpuTopology& topology = hostCpuTopology();
        if (options_.jsonOutput) {
            printJsonInfo(topology);
        } else {
            printTextInfo(topology);
        }
        out_.flush();
        return 0;

    } catch (const PZKException& e) {
        return reportFailure("Info", e);
    }
}

void InfoCommand::printTextInfo(const CpuTopology& topology) {
    out_ << "=== pzkit Host Information ===\n\n";
    out_ << fmt::format("Logical CPUs:   {}\n", topology.logicalProcessors);
    out_ << fmt::format("Physical cores: {} ({})\n", topology.physicalCores,
                        topologySourceName(topology.source));

    out_ << "\n--- Codec Backends ---\n";
    for (CodecKind codec : kAllCodecKinds) {
        const auto descriptors = backends_.descriptors(codec);
        if (descriptors.empty()) {
            out_ << fmt::format("{:<7} (none installed)\n", codecName(codec));
            continue;
        }
        for (const auto& descriptor : descriptors) {
            out_ << fmt::format("{:<7} {:<8} priority {:>2}  decode {:<12} encode {:<8} {}\n",
                                codecName(codec), descriptor.toolName, descriptor.priority,
                                parallelDecodeName(descriptor.parallelDecode),
                                descriptor.supportsParallelEncode ? "parallel" : "serial",
                                descriptor.toolPath.string());
        }
    }

    out_ << "\n--- Digest Providers ---\n";
    for (DigestKind kind : kAllDigestKinds) {
        if (!digests_.supports(kind)) {
            out_ << fmt::format("{:<10} (unavailable)\n", digestName(kind));
            continue;
        }
        const auto& descriptor = digests_.resolve(kind);
        out_ << fmt::format("{:<10} {:<8} {}\n", digestName(kind),
                            chksum::digestBackendName(descriptor.backend),
                            implementationSourceName(descriptor.implementationSource));
    }
}

void InfoCommand::printJsonInfo(const CpuTopology& topology) {
    out_ << "{\n";
    out_ << "  \"cpu\": {\n";
    out_ << fmt::format("    \"logical\": {},\n", topology.logicalProcessors);
    out_ << fmt::format("    \"physical\": {},\n", topology.physicalCores);
    out_ << fmt::format("    \"source\": \"{}\"\n", topologySourceName(topology.source));
    out_ << "  },\n";

    out_ << "  \"backends\": {\n";
    bool firstCodec = true;
    for (CodecKind codec : kAllCodecKinds) {
        out_ << (firstCodec ? "" : ",\n");
        firstCodec = false;
        out_ << fmt::format("    \"{}\": [", codecName(codec));

        bool firstTool = true;
        for (const auto& descriptor : backends_.descriptors(codec)) {
            out_ << (firstTool ? "\n" : ",\n");
            firstTool = false;
            out_ << fmt::format(
                "      {{\"tool\": \"{}\", \"path\": \"{}\", \"priority\": {}, "
                "\"parallel_decode\": \"{}\", \"parallel_encode\": {}, \"canonical\": {}}}",
                descriptor.toolName, jsonEscape(descriptor.toolPath.string()),
                descriptor.priority, parallelDecodeName(descriptor.parallelDecode),
                descriptor.supportsParallelEncode, descriptor.canonical);
        }
        out_ << (firstTool ? "]" : "\n    ]");
    }
    out_ << "\n  },\n";

    out_ << "  \"digests\": {";
    bool firstDigest = true;
    for (DigestKind kind : digests_.available()) {
        const auto& descriptor = digests_.resolve(kind);
        out_ << (firstDigest ? "\n" : ",\n");
        firstDigest = false;
        out_ << fmt::format(
            "    \"{}\": {{\"backend\": \"{}\", \"source\": \"{}\", \"parallel\": {}}}",
            digestName(kind), chksum::digestBackendName(descriptor.backend),
            implementationSourceName(descriptor.implementationSource),
            descriptor.releasesExclusiveLock);
    }
    out_ << (firstDigest ? "}\n" : "\n  }\n");
    out_ << "}\n";
}

}  // namespace pzk::commands
