// =============================================================================
// pzkit - Core Type Helpers Implementation
// =============================================================================

#include "pzk/common/types.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace pzk {

namespace {

/// @brief Lowercase a name and fold '-' into '_'.
std::string normalizeName(std::string_view name) {
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return result;
}

}  // namespace

// =============================================================================
// Codec Names
// =============================================================================

std::string_view codecName(CodecKind kind) noexcept {
    switch (kind) {
        case CodecKind::kBzip2:
            return "bzip2";
        case CodecKind::kGzip:
            return "gzip";
        case CodecKind::kXz:
            return "xz";
        case CodecKind::kZstd:
            return "zstd";
    }
    return "unknown";
}

int maxCompressionLevel(CodecKind kind) noexcept {
    return kind == CodecKind::kZstd ? 19 : 9;
}

std::optional<CodecKind> parseCodecKind(std::string_view name) noexcept {
    const std::string lower = normalizeName(name);

    if (lower == "bzip2" || lower == "bz2") {
        return CodecKind::kBzip2;
    }
    if (lower == "gzip" || lower == "gz") {
        return CodecKind::kGzip;
    }
    if (lower == "xz" || lower == "lzma") {
        return CodecKind::kXz;
    }
    if (lower == "zstd" || lower == "zst") {
        return CodecKind::kZstd;
    }
    return std::nullopt;
}

std::string_view directionName(Direction direction) noexcept {
    return direction == Direction::kCompress ? "compress" : "decompress";
}

// =============================================================================
// Digest Names
// =============================================================================

std::string_view digestName(DigestKind kind) noexcept {
    switch (kind) {
        case DigestKind::kSize:
            return "size";
        case DigestKind::kCrc32:
            return "crc32";
        case DigestKind::kAdler32:
            return "adler32";
        case DigestKind::kXxh64:
            return "xxh64";
        case DigestKind::kXxh3:
            return "xxh3";
        case DigestKind::kMd5:
            return "md5";
        case DigestKind::kSha1:
            return "sha1";
        case DigestKind::kSha256:
            return "sha256";
        case DigestKind::kSha512:
            return "sha512";
        case DigestKind::kSha3_256:
            return "sha3_256";
        case DigestKind::kSha3_512:
            return "sha3_512";
        case DigestKind::kBlake2b:
            return "blake2b";
        case DigestKind::kBlake2s:
            return "blake2s";
        case DigestKind::kWhirlpool:
            return "whirlpool";
    }
    return "unknown";
}

std::optional<DigestKind> parseDigestKind(std::string_view name) noexcept {
    const std::string lower = normalizeName(name);
    for (DigestKind kind : kAllDigestKinds) {
        if (lower == digestName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view implementationSourceName(ImplementationSource source) noexcept {
    switch (source) {
        case ImplementationSource::kNativeAccelerated:
            return "native-accelerated";
        case ImplementationSource::kNativeStandard:
            return "native-standard";
        case ImplementationSource::kPureFallback:
            return "pure-fallback";
    }
    return "unknown";
}

}  // namespace pzk
