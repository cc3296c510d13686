// =============================================================================
// pzkit - Backend Capability Registry
// =============================================================================
// Discovers installed external compression tools and ranks them per codec.
//
// Each known tool has a static profile (codec, command-line flags, declared
// parallel capabilities). Probing looks for the tool's executable in a
// search path and keeps a descriptor for every tool found. Descriptors are
// ordered by priority:
//
//   30  parallel decode of any archive of the codec   (lbzip2)
//   20  parallel decode of its own archives only      (pbzip2, pixz, pzstd)
//   10  parallel encode only                          (pigz)
//    0  single-threaded                               (bzip2, gzip, xz, zstd)
//
// The process-wide registry probes $PATH once on first use and is read-only
// afterwards; tools installed or removed later are not observed.
// =============================================================================

#ifndef PZK_CODEC_BACKEND_REGISTRY_H
#define PZK_CODEC_BACKEND_REGISTRY_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pzk/common/error.h"
#include "pzk/common/types.h"

namespace pzk::codec {

// =============================================================================
// Capability Types
// =============================================================================

/// @brief Parallel decoding capability of a tool.
enum class ParallelDecode : std::uint8_t {
    /// @brief Decodes on a single thread.
    kNone = 0,
    /// @brief Parallel only for archives it produced in parallel itself.
    kOwnArchives = 1,
    /// @brief Parallel for any archive of its codec.
    kAnyArchive = 2
};

/// @brief Static description of a known external tool.
struct ToolProfile {
    /// @brief Executable name searched in the path.
    std::string_view name;

    /// @brief Codec implemented by the tool.
    CodecKind codec;

    /// @brief Flags selecting compression to stdout from stdin.
    std::vector<std::string_view> compressArgs;

    /// @brief Flags selecting decompression to stdout from stdin.
    std::vector<std::string_view> decompressArgs;

    /// @brief Worker count flag; "{}" is replaced by the count. Empty if none.
    std::vector<std::string_view> workerArgs;

    /// @brief Declared parallel decoding capability.
    ParallelDecode parallelDecode = ParallelDecode::kNone;

    /// @brief Declared parallel encoding capability.
    bool parallelEncode = false;

    /// @brief Reference single-threaded tool of its codec.
    bool canonical = false;
};

/// @brief Table of every tool pzkit knows how to drive.
[[nodiscard]] std::span<const ToolProfile> knownToolProfiles();

/// @brief Priority derived from declared capabilities (higher is preferred).
[[nodiscard]] int capabilityPriority(ParallelDecode decode, bool parallelEncode) noexcept;

// =============================================================================
// CodecDescriptor
// =============================================================================

/// @brief A probed, installed tool with its capabilities.
/// @note Immutable once probed.
struct CodecDescriptor {
    /// @brief Codec implemented by the tool.
    CodecKind codecKind = CodecKind::kGzip;

    /// @brief Tool name (e.g., "lbzip2").
    std::string toolName;

    /// @brief Absolute path of the executable.
    std::filesystem::path toolPath;

    /// @brief Declared parallel decoding capability.
    ParallelDecode parallelDecode = ParallelDecode::kNone;

    /// @brief Whether the tool can encode in parallel.
    bool supportsParallelEncode = false;

    /// @brief Whether this is the codec's reference single-threaded tool.
    bool canonical = false;

    /// @brief Selection priority (higher is preferred).
    int priority = 0;

    /// @brief Profile the descriptor was probed from.
    const ToolProfile* profile = nullptr;

    /// @brief Whether the tool can decode in parallel at all.
    [[nodiscard]] bool supportsParallelDecode() const noexcept {
        return parallelDecode != ParallelDecode::kNone;
    }

    /// @brief Whether the tool parallelizes the given direction.
    [[nodiscard]] bool supportsParallel(Direction direction) const noexcept {
        return direction == Direction::kCompress ? supportsParallelEncode
                                                 : supportsParallelDecode();
    }

    /// @brief Build the command line for a direction.
    /// @param direction Compress or decompress.
    /// @param workers Worker count. A tool with a worker flag always gets one,
    ///        pinned to 1 when it does not parallelize the direction, so it
    ///        never falls back to its own thread default.
    /// @param level Compression level (0 = tool default, ignored when decompressing).
    [[nodiscard]] std::vector<std::string> buildArgv(Direction direction, std::size_t workers,
                                                     int level = 0) const;
};

/// @brief Get a name for a parallel decode capability.
[[nodiscard]] std::string_view parallelDecodeName(ParallelDecode decode) noexcept;

// =============================================================================
// Search Path Helpers
// =============================================================================

/// @brief Split a PATH-style string on ':' (empty entries mean ".").
[[nodiscard]] std::vector<std::filesystem::path> splitSearchPath(std::string_view pathEnv);

/// @brief The current $PATH split into directories.
[[nodiscard]] std::vector<std::filesystem::path> environmentSearchPath();

/// @brief Find an executable regular file by name.
/// @return Absolute path of the first match, or std::nullopt.
[[nodiscard]] std::optional<std::filesystem::path> findExecutable(
    std::string_view name, std::span<const std::filesystem::path> searchPath);

// =============================================================================
// BackendRegistry
// =============================================================================

/// @brief Per-codec ranked set of installed tools.
class BackendRegistry {
public:
    /// @brief Probe every known tool in the given search path.
    explicit BackendRegistry(std::vector<std::filesystem::path> searchPath);

    /// @brief Build a registry from already probed descriptors.
    explicit BackendRegistry(std::vector<CodecDescriptor> descriptors);

    /// @brief Process-wide registry probing $PATH on first use.
    /// @note Thread-safe; the instance is read-only after construction.
    [[nodiscard]] static const BackendRegistry& instance();

    /// @brief Select a backend for a codec.
    /// @param codec Requested codec.
    /// @param wantParallel Prefer the most capable parallel tool when true,
    ///        the canonical single-threaded tool when false.
    /// @throws BackendUnavailableError if no tool is installed for the codec.
    [[nodiscard]] const CodecDescriptor& resolve(CodecKind codec, bool wantParallel) const;

    /// @brief Descriptors of a codec, highest priority first.
    [[nodiscard]] std::span<const CodecDescriptor> descriptors(CodecKind codec) const;

    /// @brief Whether at least one tool is installed for the codec.
    [[nodiscard]] bool isAvailable(CodecKind codec) const;

    /// @brief Codecs with at least one installed tool.
    [[nodiscard]] std::vector<CodecKind> availableCodecs() const;

    /// @brief Directories that were searched.
    [[nodiscard]] const std::vector<std::filesystem::path>& searchPath() const noexcept {
        return searchPath_;
    }

private:
    void add(CodecDescriptor descriptor);

    std::vector<std::filesystem::path> searchPath_;
    std::map<CodecKind, std::vector<CodecDescriptor>> byCodec_;
};

}  // namespace pzk::codec

#endif  // PZK_CODEC_BACKEND_REGISTRY_H
