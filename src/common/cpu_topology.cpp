// =============================================================================
// pzkit - CPU Topology Detection Implementation
// =============================================================================

#include "pzk/common/cpu_topology.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>

#ifdef __linux__
#include <sched.h>
#endif
#include <unistd.h>

#include "pzk/common/logger.h"

namespace pzk {

namespace {

using CoreKey = std::pair<long, long>;

/// @brief Trim ASCII whitespace from both ends.
std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<long> parseLong(std::string_view text) noexcept {
    text = trim(text);
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<long> readLongFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    std::getline(in, line);
    return parseLong(line);
}

/// @brief Index N of a "cpu<N>" directory name.
std::optional<std::size_t> cpuIndexFromName(std::string_view name) noexcept {
    if (name.size() <= 3 || name.substr(0, 3) != "cpu") {
        return std::nullopt;
    }
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(name.data() + 3, name.data() + name.size(), index);
    if (ec != std::errc{} || ptr != name.data() + name.size()) {
        return std::nullopt;
    }
    return index;
}

bool isAllowed(const std::optional<CpuSet>& allowedCpus, std::size_t cpu) {
    return !allowedCpus.has_value() || allowedCpus->contains(cpu);
}

}  // namespace

std::string_view topologySourceName(TopologySource source) noexcept {
    switch (source) {
        case TopologySource::kSysfs:
            return "sysfs";
        case TopologySource::kCpuInfo:
            return "cpuinfo";
        case TopologySource::kLogicalFallback:
            return "logical-fallback";
    }
    return "unknown";
}

// =============================================================================
// Parsing Helpers
// =============================================================================

std::optional<std::size_t> countCoresFromCpuInfo(std::istream& cpuinfo,
                                                  const std::optional<CpuSet>& allowedCpus) {
    std::set<CoreKey> cores;
    std::optional<long> processor;
    std::optional<long> physicalId;
    std::optional<long> coreId;

    auto flushProcessor = [&]() {
        const bool allowed = !allowedCpus.has_value() ||
                             (processor.has_value() && *processor >= 0 &&
                              isAllowed(allowedCpus, static_cast<std::size_t>(*processor)));
        if (allowed && physicalId.has_value() && coreId.has_value()) {
            cores.emplace(*physicalId, *coreId);
        }
        processor.reset();
        physicalId.reset();
        coreId.reset();
    };

    std::string line;
    while (std::getline(cpuinfo, line)) {
        std::string_view view = trim(line);
        if (view.empty()) {
            // Blank line terminates a processor stanza
            flushProcessor();
            continue;
        }

        const auto colon = view.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        const std::string_view key = trim(view.substr(0, colon));
        const std::string_view value = view.substr(colon + 1);

        if (key == "processor") {
            flushProcessor();
            processor = parseLong(value);
        } else if (key == "physical id") {
            physicalId = parseLong(value);
        } else if (key == "core id") {
            coreId = parseLong(value);
        }
    }
    flushProcessor();

    if (cores.empty()) {
        return std::nullopt;
    }
    return cores.size();
}

std::optional<std::size_t> countCoresFromSysfs(const std::filesystem::path& cpuRoot,
                                               const std::optional<CpuSet>& allowedCpus) {
    std::error_code ec;
    std::filesystem::directory_iterator it(cpuRoot, ec);
    if (ec) {
        return std::nullopt;
    }

    std::set<CoreKey> cores;
    for (const auto& entry : it) {
        const auto index = cpuIndexFromName(entry.path().filename().string());
        if (!index.has_value() || !isAllowed(allowedCpus, *index)) {
            continue;
        }

        // Offline CPUs carry an "online" file containing 0
        if (auto online = readLongFile(entry.path() / "online"); online && *online == 0) {
            continue;
        }

        const auto topology = entry.path() / "topology";
        auto package = readLongFile(topology / "physical_package_id");
        auto core = readLongFile(topology / "core_id");
        if (!package || !core) {
            continue;
        }
        cores.emplace(*package, *core);
    }

    if (cores.empty()) {
        return std::nullopt;
    }
    return cores.size();
}

// =============================================================================
// Detection
// =============================================================================

std::size_t logicalProcessorCount() noexcept {
#ifdef __linux__
    cpu_set_t mask;
    CPU_ZERO(&mask);
    if (sched_getaffinity(0, sizeof(mask), &mask) == 0) {
        const int count = CPU_COUNT(&mask);
        if (count > 0) {
            return static_cast<std::size_t>(count);
        }
    }
#endif

    const long online = sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0) {
        return static_cast<std::size_t>(online);
    }

    const unsigned int hwThreads = std::thread::hardware_concurrency();
    return hwThreads > 0 ? hwThreads : 1;
}

std::optional<CpuSet> affinityCpus() {
#ifdef __linux__
    cpu_set_t mask;
    CPU_ZERO(&mask);
    if (sched_getaffinity(0, sizeof(mask), &mask) != 0) {
        return std::nullopt;
    }
    CpuSet cpus;
    for (std::size_t cpu = 0; cpu < static_cast<std::size_t>(CPU_SETSIZE); ++cpu) {
        if (CPU_ISSET(cpu, &mask)) {
            cpus.insert(cpu);
        }
    }
    if (cpus.empty()) {
        return std::nullopt;
    }
    return cpus;
#else
    return std::nullopt;
#endif
}

CpuTopology detectCpuTopology(const std::filesystem::path& cpuRoot,
                              const std::filesystem::path& cpuInfoPath,
                              const std::optional<CpuSet>& allowedCpus) {
    CpuTopology topology;
    topology.logicalProcessors = allowedCpus.has_value() && !allowedCpus->empty()
                                     ? allowedCpus->size()
                                     : logicalProcessorCount();

    std::optional<std::size_t> physical = countCoresFromSysfs(cpuRoot, allowedCpus);
    if (physical.has_value()) {
        topology.source = TopologySource::kSysfs;
    } else {
        std::ifstream cpuinfo(cpuInfoPath);
        if (cpuinfo) {
            physical = countCoresFromCpuInfo(cpuinfo, allowedCpus);
            if (physical.has_value()) {
                topology.source = TopologySource::kCpuInfo;
            }
        }
    }

    if (physical.has_value()) {
        // Sources that disagree with the mask never exceed the logical count
        topology.physicalCores = std::clamp<std::size_t>(*physical, 1,
                                                         topology.logicalProcessors);
    } else {
        topology.physicalCores = topology.logicalProcessors;
        topology.source = TopologySource::kLogicalFallback;
    }

    return topology;
}

const CpuTopology& hostCpuTopology() {
    static std::once_flag once;
    static CpuTopology topology;

    std::call_once(once, []() {
        topology = detectCpuTopology(kSysfsCpuRoot, kProcCpuInfoPath, affinityCpus());
        PZK_LOG_DEBUG("CPU topology: physical={}, logical={}, source={}",
                      topology.physicalCores, topology.logicalProcessors,
                      topologySourceName(topology.source));
    });
    return topology;
}

std::size_t availableParallelism() {
    return hostCpuTopology().physicalCores;
}

}  // namespace pzk
