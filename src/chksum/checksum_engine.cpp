// =============================================================================
// pzkit - Parallel Checksum Engine Implementation
// =============================================================================

#include "pzk/chksum/checksum_engine.h"

#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <string>

#include "pzk/common/cpu_topology.h"
#include "pzk/common/error.h"
#include "pzk/common/logger.h"

namespace pzk::chksum {

namespace {

/// @brief Result of one group pass.
struct GroupOutcome {
    ChecksumResult digests;
    bool failed = false;
    std::string cause;
};

/// @brief Read the whole source once, feeding every digester of the group.
ChecksumResult digestGroup(const DataSource& source,
                           const std::vector<const DigestDescriptor*>& group,
                           std::size_t bufferSize) {
    std::vector<std::unique_ptr<Digester>> digesters;
    digesters.reserve(group.size());
    for (const DigestDescriptor* descriptor : group) {
        digesters.push_back(descriptor->createDigester());
    }

    auto reader = source.openReader();
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(bufferSize, 1));
    while (*reader) {
        reader->read(reinterpret_cast<char*>(buffer.data()),
                     static_cast<std::streamsize>(buffer.size()));
        const auto count = static_cast<std::size_t>(reader->gcount());
        if (count == 0) {
            break;
        }
        const std::span<const std::uint8_t> chunk(buffer.data(), count);
        for (auto& digester : digesters) {
            digester->update(chunk);
        }
    }
    if (reader->bad()) {
        throw IOError("Read error on " + source.describe());
    }

    ChecksumResult digests;
    for (auto& digester : digesters) {
        digests.emplace(digester->kind(), digester->finish());
    }
    return digests;
}

GroupOutcome runGroup(const DataSource& source, const std::vector<const DigestDescriptor*>& group,
                      std::size_t bufferSize) {
    GroupOutcome outcome;
    try {
        outcome.digests = digestGroup(source, group, bufferSize);
    } catch (const std::exception& e) {
        outcome.failed = true;
        outcome.cause = e.what();
    }
    return outcome;
}

}  // namespace

const DigestRegistry& ChecksumEngine::registry() const {
    return config_.registry != nullptr ? *config_.registry : DigestRegistry::instance();
}

std::size_t ChecksumEngine::coreCount() const {
    return config_.availableCores != 0 ? config_.availableCores : availableParallelism();
}

ExecutionPlan ChecksumEngine::plan(std::span<const DigestKind> kinds) const {
    std::vector<const DigestDescriptor*> descriptors;
    for (DigestKind kind : kinds) {
        const DigestDescriptor& descriptor = registry().resolve(kind);
        if (std::find(descriptors.begin(), descriptors.end(), &descriptor) == descriptors.end()) {
            descriptors.push_back(&descriptor);
        }
    }

    ExecutionPlan executionPlan;
    const std::size_t cores = coreCount();
    if (descriptors.size() <= 1 || cores <= 1 || !config_.parallelize) {
        if (!descriptors.empty()) {
            executionPlan.groups.push_back(std::move(descriptors));
        }
        return executionPlan;
    }

    std::vector<const DigestDescriptor*> shared;
    for (const DigestDescriptor* descriptor : descriptors) {
        if (descriptor->releasesExclusiveLock) {
            executionPlan.groups.push_back({descriptor});
        } else {
            shared.push_back(descriptor);
        }
    }
    if (!shared.empty()) {
        executionPlan.groups.push_back(std::move(shared));
    }

    if (executionPlan.groups.size() > 1) {
        executionPlan.parallel = true;
        executionPlan.workers = std::min(executionPlan.groups.size(), cores);
    }
    return executionPlan;
}

ChecksumResult ChecksumEngine::compute(const DataSource& source,
                                       std::span<const DigestKind> kinds) const {
    const ExecutionPlan executionPlan = plan(kinds);
    std::vector<GroupOutcome> outcomes(executionPlan.groups.size());

    PZK_LOG_DEBUG("Checksumming {}: {} group(s), {} worker(s)", source.describe(),
                  executionPlan.groups.size(), executionPlan.workers);

    if (!executionPlan.parallel) {
        for (std::size_t i = 0; i < executionPlan.groups.size(); ++i) {
            outcomes[i] = runGroup(source, executionPlan.groups[i], config_.bufferSize);
        }
    } else {
        tbb::task_arena arena(static_cast<int>(executionPlan.workers));
        arena.execute([&]() {
            tbb::task_group tasks;
            for (std::size_t i = 0; i < executionPlan.groups.size(); ++i) {
                tasks.run([&, i]() {
                    outcomes[i] = runGroup(source, executionPlan.groups[i], config_.bufferSize);
                });
            }
            tasks.wait();
        });
    }

    ChecksumResult result;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].failed) {
            const DigestKind failedKind = executionPlan.groups[i].front()->digestKind;
            PZK_LOG_WARNING("Checksum {} failed on {}: {}", digestName(failedKind),
                            source.describe(), outcomes[i].cause);
            throw ChecksumComputationFailedError(failedKind, outcomes[i].cause,
                                                 ErrorContext(source.describe()));
        }
        result.merge(outcomes[i].digests);
    }
    return result;
}

ChecksumResult computeChecksums(const DataSource& source, std::span<const DigestKind> kinds,
                                const ChecksumEngineConfig& config) {
    return ChecksumEngine(config).compute(source, kinds);
}

}  // namespace pzk::chksum
