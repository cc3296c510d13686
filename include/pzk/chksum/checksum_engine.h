// =============================================================================
// pzkit - Parallel Checksum Engine
// =============================================================================
// Computes several digests over one data source, optionally in parallel.
//
// Execution policy:
// - Every requested kind is resolved before any byte is read
// - Parallel only for more than one distinct kind, more than one core and
//   parallelism enabled
// - Digests that release the exclusive lock each get their own worker; the
//   others share a single worker
// - Each worker opens its own reader over the source
// - A result is returned only when every worker succeeded
// =============================================================================

#ifndef PZK_CHKSUM_CHECKSUM_ENGINE_H
#define PZK_CHKSUM_CHECKSUM_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <vector>

#include "pzk/chksum/data_source.h"
#include "pzk/chksum/digest_registry.h"
#include "pzk/common/types.h"

namespace pzk::chksum {

/// @brief Default read size for digest workers.
inline constexpr std::size_t kDefaultChecksumBufferSize = 64 * 1024;

/// @brief Engine configuration.
struct ChecksumEngineConfig {
    /// @brief Core count (0 = detected physical cores).
    std::size_t availableCores = 0;

    /// @brief Allow running digest groups on separate workers.
    bool parallelize = true;

    /// @brief Bytes read per iteration.
    std::size_t bufferSize = kDefaultChecksumBufferSize;

    /// @brief Registry to resolve digests from (nullptr = process-wide).
    const DigestRegistry* registry = nullptr;
};

/// @brief Digest bytes per requested kind.
using ChecksumResult = std::map<DigestKind, std::vector<std::uint8_t>>;

/// @brief How a request will be executed.
struct ExecutionPlan {
    /// @brief Whether groups run on separate workers.
    bool parallel = false;

    /// @brief Worker count of the task arena (1 when inline).
    std::size_t workers = 1;

    /// @brief Digest groups; each group is one pass over the source.
    std::vector<std::vector<const DigestDescriptor*>> groups;
};

class ChecksumEngine {
public:
    ChecksumEngine() = default;

    explicit ChecksumEngine(ChecksumEngineConfig config) : config_(config) {}

    /// @brief Build the execution plan for a set of kinds.
    /// @throws UnsupportedDigestError if any kind is unavailable.
    [[nodiscard]] ExecutionPlan plan(std::span<const DigestKind> kinds) const;

    /// @brief Compute all requested digests over the source.
    /// @return Exactly one entry per distinct requested kind.
    /// @throws UnsupportedDigestError before any I/O if a kind is unavailable.
    /// @throws ChecksumComputationFailedError if any worker failed.
    [[nodiscard]] ChecksumResult compute(const DataSource& source,
                                         std::span<const DigestKind> kinds) const;

    [[nodiscard]] const ChecksumEngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] const DigestRegistry& registry() const;
    [[nodiscard]] std::size_t coreCount() const;

    ChecksumEngineConfig config_;
};

/// @brief Convenience wrapper around ChecksumEngine::compute().
[[nodiscard]] ChecksumResult computeChecksums(const DataSource& source,
                                              std::span<const DigestKind> kinds,
                                              const ChecksumEngineConfig& config = {});

}  // namespace pzk::chksum

#endif  // PZK_CHKSUM_CHECKSUM_ENGINE_H
