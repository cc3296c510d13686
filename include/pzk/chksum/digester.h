// =============================================================================
// pzkit - Incremental Digesters
// =============================================================================
// One Digester instance hashes one byte stream: update() any number of times,
// then finish() once.
//
// Backends:
// - OpenSSL EVP (md5, sha*, blake2*, whirlpool with the legacy provider)
// - zlib (crc32, adler32)
// - libxxhash (xxh64, xxh3)
// - built-in byte counter (size) and pure Whirlpool
//
// Checksum bytes are big-endian so they print the way the reference tools
// print them (crc32 "cbf43926" for "123456789").
// =============================================================================

#ifndef PZK_CHKSUM_DIGESTER_H
#define PZK_CHKSUM_DIGESTER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "pzk/common/types.h"

namespace pzk::chksum {

/// @brief Incremental digest computation.
class Digester {
public:
    virtual ~Digester() = default;

    /// @brief Feed bytes.
    /// @throws ChecksumComputationFailedError if the backend reports an error.
    virtual void update(std::span<const std::uint8_t> data) = 0;

    /// @brief Finalize and return the digest bytes.
    /// @throws InvalidStateError if called twice.
    [[nodiscard]] virtual std::vector<std::uint8_t> finish() = 0;

    /// @brief Kind of digest produced.
    [[nodiscard]] virtual DigestKind kind() const noexcept = 0;

protected:
    Digester() = default;
};

// =============================================================================
// Factories
// =============================================================================

/// @brief Whether OpenSSL can fetch a message digest by name.
[[nodiscard]] bool openSslDigestAvailable(std::string_view algorithm);

/// @brief Digester over an OpenSSL EVP message digest.
/// @throws UnsupportedDigestError if the algorithm cannot be fetched.
[[nodiscard]] std::unique_ptr<Digester> makeOpenSslDigester(DigestKind kind,
                                                            std::string_view algorithm);

/// @brief zlib crc32 or adler32 digester (4 bytes).
[[nodiscard]] std::unique_ptr<Digester> makeZlibDigester(DigestKind kind);

/// @brief libxxhash XXH64 or XXH3-64 digester (8 bytes).
[[nodiscard]] std::unique_ptr<Digester> makeXxHashDigester(DigestKind kind);

/// @brief Byte counter (8 bytes).
[[nodiscard]] std::unique_ptr<Digester> makeSizeDigester();

/// @brief Pure Whirlpool digester (64 bytes).
[[nodiscard]] std::unique_ptr<Digester> makeWhirlpoolDigester();

/// @brief One-shot helper: digest a whole buffer.
[[nodiscard]] std::vector<std::uint8_t> digestBytes(Digester& digester,
                                                    std::span<const std::uint8_t> data);

}  // namespace pzk::chksum

#endif  // PZK_CHKSUM_DIGESTER_H
