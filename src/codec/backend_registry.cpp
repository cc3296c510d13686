// =============================================================================
// pzkit - Backend Capability Registry Implementation
// =============================================================================

#include "pzk/codec/backend_registry.h"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <mutex>

#include <fmt/format.h>

#include "pzk/common/logger.h"

namespace pzk::codec {

namespace {

/// @brief Replace "{}" in a flag template with a worker count.
std::string expandWorkerArg(std::string_view pattern, std::size_t workers) {
    std::string result(pattern);
    const auto pos = result.find("{}");
    if (pos != std::string::npos) {
        result.replace(pos, 2, std::to_string(workers));
    }
    return result;
}

const std::vector<ToolProfile>& profileTable() {
    static const std::vector<ToolProfile> kProfiles = {
        // bzip2 family
        {"bzip2", CodecKind::kBzip2, {"-z", "-c"}, {"-d", "-c"}, {},
         ParallelDecode::kNone, false, true},
        {"pbzip2", CodecKind::kBzip2, {"-z", "-c"}, {"-d", "-c"}, {"-p{}"},
         ParallelDecode::kOwnArchives, true, false},
        {"lbzip2", CodecKind::kBzip2, {"-z", "-c"}, {"-d", "-c"}, {"-n", "{}"},
         ParallelDecode::kAnyArchive, true, false},

        // gzip family
        {"gzip", CodecKind::kGzip, {"-c"}, {"-d", "-c"}, {},
         ParallelDecode::kNone, false, true},
        {"pigz", CodecKind::kGzip, {"-c"}, {"-d", "-c"}, {"-p", "{}"},
         ParallelDecode::kNone, true, false},

        // xz family
        {"xz", CodecKind::kXz, {"-z", "-c", "-T1"}, {"-d", "-c", "-T1"}, {},
         ParallelDecode::kNone, false, true},
        {"pixz", CodecKind::kXz, {}, {"-d"}, {"-p", "{}"},
         ParallelDecode::kOwnArchives, true, false},

        // zstd family
        {"zstd", CodecKind::kZstd, {"-q", "-c"}, {"-q", "-d", "-c"}, {},
         ParallelDecode::kNone, false, true},
        {"pzstd", CodecKind::kZstd, {"-c"}, {"-d", "-c"}, {"-p", "{}"},
         ParallelDecode::kOwnArchives, true, false},
    };
    return kProfiles;
}

}  // namespace

std::span<const ToolProfile> knownToolProfiles() {
    return profileTable();
}

int capabilityPriority(ParallelDecode decode, bool parallelEncode) noexcept {
    switch (decode) {
        case ParallelDecode::kAnyArchive:
            return 30;
        case ParallelDecode::kOwnArchives:
            return 20;
        case ParallelDecode::kNone:
            break;
    }
    return parallelEncode ? 10 : 0;
}

std::string_view parallelDecodeName(ParallelDecode decode) noexcept {
    switch (decode) {
        case ParallelDecode::kNone:
            return "none";
        case ParallelDecode::kOwnArchives:
            return "own-archives";
        case ParallelDecode::kAnyArchive:
            return "any-archive";
    }
    return "unknown";
}

// =============================================================================
// CodecDescriptor Implementation
// =============================================================================

std::vector<std::string> CodecDescriptor::buildArgv(Direction direction, std::size_t workers,
                                                    int level) const {
    std::vector<std::string> argv;
    argv.push_back(toolPath.string());

    if (profile != nullptr) {
        const auto& modeArgs =
            direction == Direction::kCompress ? profile->compressArgs : profile->decompressArgs;
        for (std::string_view arg : modeArgs) {
            argv.emplace_back(arg);
        }
    }

    if (direction == Direction::kCompress && level > 0) {
        argv.push_back(fmt::format("-{}", level));
    }

    if (profile != nullptr && !profile->workerArgs.empty()) {
        const std::size_t pinned = supportsParallel(direction) ? std::max<std::size_t>(workers, 1)
                                                               : 1;
        for (std::string_view arg : profile->workerArgs) {
            argv.push_back(expandWorkerArg(arg, pinned));
        }
    }

    return argv;
}

// =============================================================================
// Search Path Helpers
// =============================================================================

std::vector<std::filesystem::path> splitSearchPath(std::string_view pathEnv) {
    std::vector<std::filesystem::path> dirs;
    std::size_t start = 0;
    while (start <= pathEnv.size()) {
        auto end = pathEnv.find(':', start);
        if (end == std::string_view::npos) {
            end = pathEnv.size();
        }
        const std::string_view entry = pathEnv.substr(start, end - start);
        dirs.emplace_back(entry.empty() ? std::string_view(".") : entry);
        start = end + 1;
    }
    return dirs;
}

std::vector<std::filesystem::path> environmentSearchPath() {
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return splitSearchPath("/usr/local/bin:/usr/bin:/bin");
    }
    return splitSearchPath(pathEnv);
}

std::optional<std::filesystem::path> findExecutable(
    std::string_view name, std::span<const std::filesystem::path> searchPath) {
    for (const auto& dir : searchPath) {
        const std::filesystem::path candidate = dir / name;

        struct stat info {};
        if (::stat(candidate.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
            continue;
        }
        if (::access(candidate.c_str(), X_OK) != 0) {
            continue;
        }

        std::error_code ec;
        auto absolute = std::filesystem::absolute(candidate, ec);
        return ec ? candidate : absolute;
    }
    return std::nullopt;
}

// =============================================================================
// BackendRegistry Implementation
// =============================================================================

BackendRegistry::BackendRegistry(std::vector<std::filesystem::path> searchPath)
    : searchPath_(std::move(searchPath)) {
    for (const ToolProfile& profile : knownToolProfiles()) {
        auto path = findExecutable(profile.name, searchPath_);
        if (!path.has_value()) {
            PZK_LOG_TRACE("Backend {} not found", profile.name);
            continue;
        }

        CodecDescriptor descriptor;
        descriptor.codecKind = profile.codec;
        descriptor.toolName = std::string(profile.name);
        descriptor.toolPath = std::move(*path);
        descriptor.parallelDecode = profile.parallelDecode;
        descriptor.supportsParallelEncode = profile.parallelEncode;
        descriptor.canonical = profile.canonical;
        descriptor.priority = capabilityPriority(profile.parallelDecode, profile.parallelEncode);
        descriptor.profile = &profile;

        PZK_LOG_DEBUG("Backend found: {} for {} at {} (priority {})", descriptor.toolName,
                      codecName(descriptor.codecKind), descriptor.toolPath.string(),
                      descriptor.priority);
        add(std::move(descriptor));
    }
}

BackendRegistry::BackendRegistry(std::vector<CodecDescriptor> descriptors) {
    for (auto& descriptor : descriptors) {
        add(std::move(descriptor));
    }
}

const BackendRegistry& BackendRegistry::instance() {
    static std::once_flag once;
    static std::unique_ptr<BackendRegistry> registry;

    std::call_once(once, []() {
        registry = std::make_unique<BackendRegistry>(environmentSearchPath());
    });
    return *registry;
}

void BackendRegistry::add(CodecDescriptor descriptor) {
    auto& list = byCodec_[descriptor.codecKind];
    list.push_back(std::move(descriptor));
    std::stable_sort(list.begin(), list.end(), [](const auto& a, const auto& b) {
        return a.priority > b.priority;
    });
}

const CodecDescriptor& BackendRegistry::resolve(CodecKind codec, bool wantParallel) const {
    auto it = byCodec_.find(codec);
    if (it == byCodec_.end() || it->second.empty()) {
        throw BackendUnavailableError(codec);
    }
    const auto& list = it->second;

    if (!wantParallel) {
        auto canonical = std::find_if(list.begin(), list.end(),
                                      [](const auto& d) { return d.canonical; });
        if (canonical != list.end()) {
            return *canonical;
        }
        // Degrade to the most compatible tool available
        PZK_LOG_DEBUG("No single-threaded {} tool installed, using {}", codecName(codec),
                      list.front().toolName);
    }
    return list.front();
}

std::span<const CodecDescriptor> BackendRegistry::descriptors(CodecKind codec) const {
    auto it = byCodec_.find(codec);
    if (it == byCodec_.end()) {
        return {};
    }
    return it->second;
}

bool BackendRegistry::isAvailable(CodecKind codec) const {
    return !descriptors(codec).empty();
}

std::vector<CodecKind> BackendRegistry::availableCodecs() const {
    std::vector<CodecKind> codecs;
    for (const auto& [codec, list] : byCodec_) {
        if (!list.empty()) {
            codecs.push_back(codec);
        }
    }
    return codecs;
}

}  // namespace pzk::codec
