// =============================================================================
// pzkit - Whirlpool Hash
// =============================================================================
// Portable implementation of the final (2003) Whirlpool hash, used when the
// OpenSSL build does not expose WHIRLPOOL through its providers.
//
// 512-bit blocks, 10 rounds of the W block cipher in Miyaguchi-Preneel mode,
// lookup tables generated at compile time from the 4-bit E and R mini-boxes.
// =============================================================================

#ifndef PZK_CHKSUM_WHIRLPOOL_H
#define PZK_CHKSUM_WHIRLPOOL_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pzk::chksum {

class Whirlpool {
public:
    static constexpr std::size_t kDigestSize = 64;
    static constexpr std::size_t kBlockSize = 64;
    static constexpr std::size_t kRounds = 10;

    using Digest = std::array<std::uint8_t, kDigestSize>;

    Whirlpool() noexcept { reset(); }

    /// @brief Restart from the initial (all-zero) state.
    void reset() noexcept;

    /// @brief Absorb bytes.
    void update(std::span<const std::uint8_t> data) noexcept;

    /// @brief Pad, process the final block(s) and return the digest.
    /// @note The object must be reset() before reuse.
    [[nodiscard]] Digest finish() noexcept;

    /// @brief One-shot digest.
    [[nodiscard]] static Digest digest(std::span<const std::uint8_t> data) noexcept;

private:
    void processBlock(const std::uint8_t* block) noexcept;

    std::array<std::uint64_t, 8> hash_{};
    std::array<std::uint8_t, kBlockSize> buffer_{};
    std::size_t bufferLength_ = 0;
    std::uint64_t totalBytes_ = 0;
};

}  // namespace pzk::chksum

#endif  // PZK_CHKSUM_WHIRLPOOL_H
