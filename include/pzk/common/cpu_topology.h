// =============================================================================
// pzkit - CPU Topology Detection
// =============================================================================
// Counts physical execution units (hyperthread siblings excluded) to size
// worker pools and external tool thread counts.
//
// Detection order:
// 1. sysfs topology (physical_package_id, core_id) pairs
// 2. /proc/cpuinfo (physical id, core id) pairs
// 3. Logical processor count (affinity mask, sysconf, hardware_concurrency)
//
// Only CPUs in the process affinity mask are counted, so two SMT siblings
// allowed by taskset count as one core.
//
// External compressors and digest workers gain nothing from SMT siblings, so
// the physical count is what callers get. The process-wide value is computed
// once and frozen.
// =============================================================================

#ifndef PZK_COMMON_CPU_TOPOLOGY_H
#define PZK_COMMON_CPU_TOPOLOGY_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <set>
#include <string_view>

namespace pzk {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default sysfs CPU directory.
inline constexpr std::string_view kSysfsCpuRoot = "/sys/devices/system/cpu";

/// @brief Default cpuinfo path.
inline constexpr std::string_view kProcCpuInfoPath = "/proc/cpuinfo";

// =============================================================================
// Topology Types
// =============================================================================

/// @brief Where a topology result came from.
enum class TopologySource : std::uint8_t {
    kSysfs = 0,
    kCpuInfo = 1,
    kLogicalFallback = 2
};

/// @brief Snapshot of the host CPU topology.
struct CpuTopology {
    /// @brief Logical processors usable by this process (>= 1).
    std::size_t logicalProcessors = 1;

    /// @brief Physical cores usable by this process (>= 1, <= logical).
    std::size_t physicalCores = 1;

    /// @brief Source of the physical core count.
    TopologySource source = TopologySource::kLogicalFallback;
};

/// @brief Set of logical CPU indices (the N of cpuN).
using CpuSet = std::set<std::size_t>;

/// @brief Get a name for a topology source.
[[nodiscard]] std::string_view topologySourceName(TopologySource source) noexcept;

// =============================================================================
// Parsing Helpers
// =============================================================================

/// @brief Count unique (physical id, core id) pairs in cpuinfo text.
/// @param cpuinfo Stream over /proc/cpuinfo formatted text.
/// @param allowedCpus Processors to consider (std::nullopt = all).
/// @return Core count, or std::nullopt if the text carries no topology.
[[nodiscard]] std::optional<std::size_t> countCoresFromCpuInfo(
    std::istream& cpuinfo, const std::optional<CpuSet>& allowedCpus = std::nullopt);

/// @brief Count unique (package, core) pairs below a sysfs CPU directory.
/// @param cpuRoot Directory containing cpuN/topology subdirectories.
/// @param allowedCpus CPUs to consider (std::nullopt = every online CPU).
/// @return Core count, or std::nullopt if no topology files could be read.
[[nodiscard]] std::optional<std::size_t> countCoresFromSysfs(
    const std::filesystem::path& cpuRoot,
    const std::optional<CpuSet>& allowedCpus = std::nullopt);

// =============================================================================
// Detection
// =============================================================================

/// @brief Number of logical processors this process may run on (>= 1).
[[nodiscard]] std::size_t logicalProcessorCount() noexcept;

/// @brief CPUs in this process's affinity mask.
/// @return std::nullopt where the mask cannot be queried.
[[nodiscard]] std::optional<CpuSet> affinityCpus();

/// @brief Detect the topology from the given sources (uncached).
/// @param cpuRoot sysfs CPU directory.
/// @param cpuInfoPath cpuinfo file path.
/// @param allowedCpus CPUs the work may run on; when set, its size is the
///        logical count (std::nullopt = every CPU, logicalProcessorCount()).
[[nodiscard]] CpuTopology detectCpuTopology(
    const std::filesystem::path& cpuRoot = kSysfsCpuRoot,
    const std::filesystem::path& cpuInfoPath = kProcCpuInfoPath,
    const std::optional<CpuSet>& allowedCpus = std::nullopt);

/// @brief Process-wide topology for the current affinity mask, detected on
///        first use and frozen.
[[nodiscard]] const CpuTopology& hostCpuTopology();

/// @brief Number of physical cores available for parallel work (>= 1).
/// @note Cached after the first call; safe to call from any thread.
[[nodiscard]] std::size_t availableParallelism();

}  // namespace pzk

#endif  // PZK_COMMON_CPU_TOPOLOGY_H
