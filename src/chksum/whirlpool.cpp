// =============================================================================
// pzkit - Whirlpool Hash Implementation
// =============================================================================

#include "pzk/chksum/whirlpool.h"

#include <algorithm>
#include <bit>
#include <cstring>

namespace pzk::chksum {

namespace {

using Box = std::array<std::uint8_t, 16>;
using Table = std::array<std::uint64_t, 256>;

// Mini-boxes of the S-box construction
constexpr Box kE = {0x1, 0xB, 0x9, 0xC, 0xD, 0x6, 0xF, 0x3,
                    0xE, 0x8, 0x7, 0x4, 0xA, 0x2, 0x5, 0x0};
constexpr Box kR = {0x7, 0xC, 0xB, 0xD, 0xE, 0x4, 0x9, 0xF,
                    0x6, 0x3, 0x8, 0xA, 0x2, 0x5, 0x1, 0x0};

// First row of the circulant diffusion matrix cir(1, 1, 4, 1, 8, 5, 2, 9)
constexpr std::uint8_t kMatrixRow[8] = {1, 1, 4, 1, 8, 5, 2, 9};

constexpr Box invert(const Box& box) {
    Box inverse{};
    for (std::size_t i = 0; i < box.size(); ++i) {
        inverse[box[i]] = static_cast<std::uint8_t>(i);
    }
    return inverse;
}

constexpr std::array<std::uint8_t, 256> makeSbox() {
    const Box eInverse = invert(kE);
    std::array<std::uint8_t, 256> sbox{};
    for (unsigned x = 0; x < 256; ++x) {
        const unsigned a = kE[x >> 4];
        const unsigned b = eInverse[x & 0x0F];
        const unsigned r = kR[a ^ b];
        sbox[x] = static_cast<std::uint8_t>((kE[a ^ r] << 4) | eInverse[b ^ r]);
    }
    return sbox;
}

/// @brief Multiply in GF(2^8) modulo x^8 + x^4 + x^3 + x^2 + 1.
constexpr std::uint8_t gfMultiply(unsigned a, unsigned b) {
    unsigned result = 0;
    while (b != 0) {
        if ((b & 1U) != 0) {
            result ^= a;
        }
        a <<= 1;
        if ((a & 0x100U) != 0) {
            a ^= 0x11DU;
        }
        b >>= 1;
    }
    return static_cast<std::uint8_t>(result);
}

constexpr auto kSbox = makeSbox();

constexpr std::array<Table, 8> makeTables() {
    std::array<Table, 8> tables{};
    for (unsigned x = 0; x < 256; ++x) {
        std::uint64_t row = 0;
        for (std::uint8_t factor : kMatrixRow) {
            row = (row << 8) | gfMultiply(kSbox[x], factor);
        }
        for (int t = 0; t < 8; ++t) {
            tables[t][x] = std::rotr(row, 8 * t);
        }
    }
    return tables;
}

constexpr std::array<std::uint64_t, Whirlpool::kRounds + 1> makeRoundConstants() {
    std::array<std::uint64_t, Whirlpool::kRounds + 1> constants{};
    for (std::size_t r = 1; r <= Whirlpool::kRounds; ++r) {
        std::uint64_t value = 0;
        for (std::size_t j = 0; j < 8; ++j) {
            value = (value << 8) | kSbox[8 * (r - 1) + j];
        }
        constants[r] = value;
    }
    return constants;
}

constexpr auto kTables = makeTables();
constexpr auto kRoundConstants = makeRoundConstants();

static_assert(kSbox[0x00] == 0x18 && kSbox[0x01] == 0x23 && kSbox[0xFF] == 0x86);
static_assert(kTables[0][0] == 0x18186018C07830D8ULL);

inline std::uint64_t loadBigEndian(const std::uint8_t* bytes) noexcept {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

inline void storeBigEndian(std::uint64_t value, std::uint8_t* bytes) noexcept {
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<std::uint8_t>(value);
        value >>= 8;
    }
}

/// @brief One application of the round function to an 8-word state.
inline std::array<std::uint64_t, 8> roundFunction(const std::array<std::uint64_t, 8>& in) noexcept {
    std::array<std::uint64_t, 8> out{};
    for (std::size_t i = 0; i < 8; ++i) {
        std::uint64_t word = 0;
        for (std::size_t t = 0; t < 8; ++t) {
            word ^= kTables[t][(in[(i - t) & 7] >> (56 - 8 * t)) & 0xFF];
        }
        out[i] = word;
    }
    return out;
}

}  // namespace

void Whirlpool::reset() noexcept {
    hash_.fill(0);
    buffer_.fill(0);
    bufferLength_ = 0;
    totalBytes_ = 0;
}

void Whirlpool::processBlock(const std::uint8_t* block) noexcept {
    std::array<std::uint64_t, 8> message{};
    std::array<std::uint64_t, 8> key = hash_;
    std::array<std::uint64_t, 8> state{};

    for (std::size_t i = 0; i < 8; ++i) {
        message[i] = loadBigEndian(block + 8 * i);
        state[i] = message[i] ^ key[i];
    }

    for (std::size_t r = 1; r <= kRounds; ++r) {
        key = roundFunction(key);
        key[0] ^= kRoundConstants[r];

        state = roundFunction(state);
        for (std::size_t i = 0; i < 8; ++i) {
            state[i] ^= key[i];
        }
    }

    // Miyaguchi-Preneel feed-forward
    for (std::size_t i = 0; i < 8; ++i) {
        hash_[i] ^= state[i] ^ message[i];
    }
}

void Whirlpool::update(std::span<const std::uint8_t> data) noexcept {
    totalBytes_ += data.size();

    std::size_t offset = 0;
    while (offset < data.size()) {
        const std::size_t take = std::min(kBlockSize - bufferLength_, data.size() - offset);
        std::memcpy(buffer_.data() + bufferLength_, data.data() + offset, take);
        bufferLength_ += take;
        offset += take;

        if (bufferLength_ == kBlockSize) {
            processBlock(buffer_.data());
            bufferLength_ = 0;
        }
    }
}

Whirlpool::Digest Whirlpool::finish() noexcept {
    // 256-bit big-endian bit length; only the low 128 bits can be non-zero
    const std::uint64_t bitsLow = totalBytes_ << 3;
    const std::uint64_t bitsHigh = totalBytes_ >> 61;

    buffer_[bufferLength_++] = 0x80;
    if (bufferLength_ > kBlockSize - 32) {
        std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(bufferLength_), buffer_.end(), 0);
        processBlock(buffer_.data());
        bufferLength_ = 0;
    }
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(bufferLength_), buffer_.begin() + 48,
              0);
    storeBigEndian(bitsHigh, buffer_.data() + 48);
    storeBigEndian(bitsLow, buffer_.data() + 56);
    processBlock(buffer_.data());

    Digest digest{};
    for (std::size_t i = 0; i < 8; ++i) {
        storeBigEndian(hash_[i], digest.data() + 8 * i);
    }
    return digest;
}

Whirlpool::Digest Whirlpool::digest(std::span<const std::uint8_t> data) noexcept {
    Whirlpool hasher;
    hasher.update(data);
    return hasher.finish();
}

}  // namespace pzk::chksum
