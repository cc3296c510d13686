// =============================================================================
// pzkit - Core Type Definitions
// =============================================================================
// Shared enumerations used across the codec and checksum layers.
//
// This module provides:
// - CodecKind / Direction: external codec selection
// - DigestKind / ImplementationSource: digest provider selection
// - ParallelismPreference: caller-facing parallelism request
// - Name conversion helpers for all of the above
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Functions: camelCase
// =============================================================================

#ifndef PZK_COMMON_TYPES_H
#define PZK_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pzk {

// =============================================================================
// Codec Types
// =============================================================================

/// @brief Compression codecs handled through external tools.
enum class CodecKind : std::uint8_t {
    kBzip2 = 0,
    kGzip = 1,
    kXz = 2,
    kZstd = 3
};

/// @brief All codec kinds, in declaration order.
inline constexpr CodecKind kAllCodecKinds[] = {
    CodecKind::kBzip2, CodecKind::kGzip, CodecKind::kXz, CodecKind::kZstd};

/// @brief Direction of a codec operation.
enum class Direction : std::uint8_t {
    kCompress = 0,
    kDecompress = 1
};

/// @brief Get the canonical name of a codec (e.g., "bzip2").
[[nodiscard]] std::string_view codecName(CodecKind kind) noexcept;

/// @brief Highest "-<level>" the codec's tools accept (9, or 19 for zstd).
[[nodiscard]] int maxCompressionLevel(CodecKind kind) noexcept;

/// @brief Parse a codec name (case-insensitive, accepts "bz2", "gz", "zst").
/// @return The codec, or std::nullopt for unknown names.
[[nodiscard]] std::optional<CodecKind> parseCodecKind(std::string_view name) noexcept;

/// @brief Get the name of a direction ("compress" / "decompress").
[[nodiscard]] std::string_view directionName(Direction direction) noexcept;

// =============================================================================
// Digest Types
// =============================================================================

/// @brief Digest (checksum / hash) algorithms.
enum class DigestKind : std::uint8_t {
    kSize = 0,
    kCrc32,
    kAdler32,
    kXxh64,
    kXxh3,
    kMd5,
    kSha1,
    kSha256,
    kSha512,
    kSha3_256,
    kSha3_512,
    kBlake2b,
    kBlake2s,
    kWhirlpool
};

/// @brief All digest kinds, in declaration order.
inline constexpr DigestKind kAllDigestKinds[] = {
    DigestKind::kSize,     DigestKind::kCrc32,    DigestKind::kAdler32,  DigestKind::kXxh64,
    DigestKind::kXxh3,     DigestKind::kMd5,      DigestKind::kSha1,     DigestKind::kSha256,
    DigestKind::kSha512,   DigestKind::kSha3_256, DigestKind::kSha3_512, DigestKind::kBlake2b,
    DigestKind::kBlake2s,  DigestKind::kWhirlpool};

/// @brief Where a digest implementation comes from.
/// @note Declaration order is preference order (best first).
enum class ImplementationSource : std::uint8_t {
    /// @brief Optimized native library code (OpenSSL EVP).
    kNativeAccelerated = 0,
    /// @brief Plain native library code (zlib, xxHash).
    kNativeStandard = 1,
    /// @brief Implementation bundled with pzkit.
    kPureFallback = 2
};

/// @brief Get the canonical name of a digest kind (e.g., "sha256").
[[nodiscard]] std::string_view digestName(DigestKind kind) noexcept;

/// @brief Parse a digest name (case-insensitive, '-' and '_' are equivalent).
/// @return The digest kind, or std::nullopt for unknown names.
[[nodiscard]] std::optional<DigestKind> parseDigestKind(std::string_view name) noexcept;

/// @brief Get the name of an implementation source.
[[nodiscard]] std::string_view implementationSourceName(ImplementationSource source) noexcept;

// =============================================================================
// Parallelism Preference
// =============================================================================

/// @brief Caller's request to use (or avoid) multi-worker backends.
struct ParallelismPreference {
    /// @brief Whether parallel-capable backends are wanted at all.
    bool parallel = true;

    /// @brief Explicit worker count (0 = use detected physical cores).
    std::size_t workers = 0;

    /// @brief Single-threaded preference.
    [[nodiscard]] static constexpr ParallelismPreference serial() noexcept {
        return ParallelismPreference{false, 1};
    }

    /// @brief Parallel preference sized by the detected core count.
    [[nodiscard]] static constexpr ParallelismPreference automatic() noexcept {
        return ParallelismPreference{true, 0};
    }

    /// @brief Parallel preference with an explicit worker count.
    /// @note A count of 1 is treated as serial.
    [[nodiscard]] static constexpr ParallelismPreference withWorkers(std::size_t count) noexcept {
        return ParallelismPreference{count != 1, count};
    }

    /// @brief Resolve the worker count to request from a tool.
    /// @param availableCores Physical core count (>= 1).
    /// @return Worker count in [1, availableCores].
    [[nodiscard]] constexpr std::size_t effectiveWorkers(
        std::size_t availableCores) const noexcept {
        if (availableCores == 0) {
            availableCores = 1;
        }
        if (!parallel) {
            return 1;
        }
        if (workers == 0 || workers > availableCores) {
            return availableCores;
        }
        return workers;
    }

    friend constexpr bool operator==(const ParallelismPreference&,
                                     const ParallelismPreference&) = default;
};

}  // namespace pzk

#endif  // PZK_COMMON_TYPES_H
