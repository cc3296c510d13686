// =============================================================================
// pzkit - Digest Provider Registry
// =============================================================================
// Maps each digest kind to the best implementation available in this
// process. Candidates are tried best-first from a static table:
//
//   kind                          candidates
//   md5 sha1 sha256 sha512        OpenSSL EVP                   (accelerated)
//   sha3_256 sha3_512
//   blake2b blake2s
//   whirlpool                     OpenSSL EVP, legacy provider  (accelerated)
//                                 built-in Whirlpool            (fallback)
//   xxh64 xxh3                    libxxhash                     (standard)
//   crc32 adler32                 zlib                          (standard)
//   size                          built-in byte counter         (fallback)
//
// The process-wide registry resolves every kind once on first use and is
// read-only afterwards.
// =============================================================================

#ifndef PZK_CHKSUM_DIGEST_REGISTRY_H
#define PZK_CHKSUM_DIGEST_REGISTRY_H

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pzk/chksum/digester.h"
#include "pzk/common/error.h"
#include "pzk/common/types.h"

namespace pzk::chksum {

// =============================================================================
// Candidates
// =============================================================================

/// @brief Library providing an implementation.
enum class DigestBackend : std::uint8_t {
    kOpenSsl = 0,
    kZlib = 1,
    kXxHash = 2,
    kBuiltin = 3
};

/// @brief Get a name for a digest backend.
[[nodiscard]] std::string_view digestBackendName(DigestBackend backend) noexcept;

/// @brief One entry of the candidate table.
struct DigestCandidate {
    DigestKind kind;
    DigestBackend backend;
    ImplementationSource source;
    /// @brief OpenSSL algorithm name (empty for other backends).
    std::string_view algorithm;
};

/// @brief The static candidate table, best candidate first for each kind.
[[nodiscard]] std::span<const DigestCandidate> digestCandidates();

// =============================================================================
// DigestDescriptor
// =============================================================================

/// @brief Resolved implementation of one digest kind.
struct DigestDescriptor {
    DigestKind digestKind = DigestKind::kSize;
    ImplementationSource implementationSource = ImplementationSource::kPureFallback;
    DigestBackend backend = DigestBackend::kBuiltin;
    std::string algorithm;

    /// @brief Whether the digest can run on its own worker without
    ///        serializing against other digests.
    bool releasesExclusiveLock = false;

    /// @brief Build a fresh incremental digester.
    [[nodiscard]] std::unique_ptr<Digester> createDigester() const;
};

// =============================================================================
// DigestRegistry
// =============================================================================

class DigestRegistry {
public:
    /// @brief Implementation tiers the registry may pick from.
    struct Options {
        bool allowAccelerated = true;
        bool allowStandard = true;
        bool allowFallback = true;
    };

    /// @brief Resolve every kind with all tiers allowed.
    DigestRegistry();

    /// @brief Resolve every kind within the allowed tiers.
    explicit DigestRegistry(Options options);

    /// @brief Process-wide registry, resolved on first use.
    [[nodiscard]] static const DigestRegistry& instance();

    /// @brief Descriptor for a digest kind.
    /// @throws UnsupportedDigestError if no candidate is available.
    [[nodiscard]] const DigestDescriptor& resolve(DigestKind kind) const;

    [[nodiscard]] bool supports(DigestKind kind) const noexcept;

    /// @brief Supported kinds in canonical order.
    [[nodiscard]] std::vector<DigestKind> available() const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    [[nodiscard]] bool allows(ImplementationSource source) const noexcept;

    Options options_;
    std::map<DigestKind, DigestDescriptor> resolved_;
};

// =============================================================================
// Formatting
// =============================================================================

/// @brief Render digest bytes (lowercase hex; decimal byte count for size).
[[nodiscard]] std::string formatDigest(DigestKind kind, std::span<const std::uint8_t> bytes);

/// @brief Parse a comma-separated list of digest names.
/// @throws UnsupportedDigestError naming the first unknown entry.
[[nodiscard]] std::vector<DigestKind> parseDigestList(std::string_view list);

}  // namespace pzk::chksum

#endif  // PZK_CHKSUM_DIGEST_REGISTRY_H
