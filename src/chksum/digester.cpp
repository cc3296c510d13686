// =============================================================================
// pzkit - Incremental Digesters Implementation
// =============================================================================

#include "pzk/chksum/digester.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <xxhash.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>
#include <memory>
#include <string>

#include "pzk/chksum/whirlpool.h"
#include "pzk/common/error.h"

namespace pzk::chksum {

namespace {

struct EvpMdDeleter {
    void operator()(EVP_MD* md) const noexcept { EVP_MD_free(md); }
};

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using UniqueMd = std::unique_ptr<EVP_MD, EvpMdDeleter>;
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

/// @brief Pop the most recent OpenSSL error as text.
std::string takeOpenSslError() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    return buffer.data();
}

UniqueMd fetchDigest(std::string_view algorithm) {
    UniqueMd md(EVP_MD_fetch(nullptr, std::string(algorithm).c_str(), nullptr));
    if (!md) {
        ERR_clear_error();
    }
    return md;
}

template <typename T>
void appendBigEndian(std::vector<std::uint8_t>& out, T value) {
    for (int shift = static_cast<int>(sizeof(T) * 8) - 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

/// @brief Shared finish() bookkeeping.
class DigesterBase : public Digester {
public:
    explicit DigesterBase(DigestKind kind) noexcept : kind_(kind) {}

    [[nodiscard]] DigestKind kind() const noexcept override { return kind_; }

protected:
    void markFinished() {
        if (finished_) {
            throw InvalidStateError(std::string(digestName(kind_)) + " digester already finished");
        }
        finished_ = true;
    }

    void requireUnfinished() const {
        if (finished_) {
            throw InvalidStateError(std::string(digestName(kind_)) +
                                    " digester updated after finish");
        }
    }

private:
    DigestKind kind_;
    bool finished_ = false;
};

// =============================================================================
// OpenSSL EVP
// =============================================================================

class OpenSslDigester final : public DigesterBase {
public:
    OpenSslDigester(DigestKind kind, UniqueMd md) : DigesterBase(kind), md_(std::move(md)) {
        ctx_.reset(EVP_MD_CTX_new());
        if (!ctx_) {
            throw ChecksumComputationFailedError(kind, "digest context allocation failed");
        }
        if (EVP_DigestInit_ex2(ctx_.get(), md_.get(), nullptr) != 1) {
            throw ChecksumComputationFailedError(kind, takeOpenSslError());
        }
    }

    void update(std::span<const std::uint8_t> data) override {
        requireUnfinished();
        if (data.empty()) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            throw ChecksumComputationFailedError(kind(), takeOpenSslError());
        }
    }

    std::vector<std::uint8_t> finish() override {
        markFinished();
        std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &length) != 1) {
            throw ChecksumComputationFailedError(kind(), takeOpenSslError());
        }
        out.resize(length);
        return out;
    }

private:
    UniqueMd md_;
    UniqueMdCtx ctx_;
};

// =============================================================================
// zlib
// =============================================================================

class ZlibDigester final : public DigesterBase {
public:
    explicit ZlibDigester(DigestKind kind) : DigesterBase(kind) {
        value_ = kind == DigestKind::kAdler32 ? ::adler32(0L, Z_NULL, 0) : ::crc32(0L, Z_NULL, 0);
    }

    void update(std::span<const std::uint8_t> data) override {
        requireUnfinished();
        // zlib takes uInt lengths
        constexpr std::size_t kMaxChunk = std::numeric_limits<uInt>::max();
        std::size_t offset = 0;
        while (offset < data.size()) {
            const auto chunk = static_cast<uInt>(std::min(kMaxChunk, data.size() - offset));
            const Bytef* bytes = reinterpret_cast<const Bytef*>(data.data() + offset);
            value_ = kind() == DigestKind::kAdler32 ? ::adler32(value_, bytes, chunk)
                                                    : ::crc32(value_, bytes, chunk);
            offset += chunk;
        }
    }

    std::vector<std::uint8_t> finish() override {
        markFinished();
        std::vector<std::uint8_t> out;
        appendBigEndian(out, static_cast<std::uint32_t>(value_));
        return out;
    }

private:
    uLong value_ = 0;
};

// =============================================================================
// xxHash
// =============================================================================

class Xxh64Digester final : public DigesterBase {
public:
    Xxh64Digester() : DigesterBase(DigestKind::kXxh64), state_(XXH64_createState()) {
        if (state_ == nullptr || XXH64_reset(state_, 0) != XXH_OK) {
            XXH64_freeState(state_);
            throw ChecksumComputationFailedError(kind(), "XXH64 state allocation failed");
        }
    }

    ~Xxh64Digester() override { XXH64_freeState(state_); }

    Xxh64Digester(const Xxh64Digester&) = delete;
    Xxh64Digester& operator=(const Xxh64Digester&) = delete;

    void update(std::span<const std::uint8_t> data) override {
        requireUnfinished();
        if (XXH64_update(state_, data.data(), data.size()) != XXH_OK) {
            throw ChecksumComputationFailedError(kind(), "XXH64 update failed");
        }
    }

    std::vector<std::uint8_t> finish() override {
        markFinished();
        std::vector<std::uint8_t> out;
        appendBigEndian(out, static_cast<std::uint64_t>(XXH64_digest(state_)));
        return out;
    }

private:
    XXH64_state_t* state_;
};

class Xxh3Digester final : public DigesterBase {
public:
    Xxh3Digester() : DigesterBase(DigestKind::kXxh3), state_(XXH3_createState()) {
        if (state_ == nullptr || XXH3_64bits_reset(state_) != XXH_OK) {
            XXH3_freeState(state_);
            throw ChecksumComputationFailedError(kind(), "XXH3 state allocation failed");
        }
    }

    ~Xxh3Digester() override { XXH3_freeState(state_); }

    Xxh3Digester(const Xxh3Digester&) = delete;
    Xxh3Digester& operator=(const Xxh3Digester&) = delete;

    void update(std::span<const std::uint8_t> data) override {
        requireUnfinished();
        if (XXH3_64bits_update(state_, data.data(), data.size()) != XXH_OK) {
            throw ChecksumComputationFailedError(kind(), "XXH3 update failed");
        }
    }

    std::vector<std::uint8_t> finish() override {
        markFinished();
        std::vector<std::uint8_t> out;
        appendBigEndian(out, static_cast<std::uint64_t>(XXH3_64bits_digest(state_)));
        return out;
    }

private:
    XXH3_state_t* state_;
};

// =============================================================================
// Built-in
// =============================================================================

class SizeDigester final : public DigesterBase {
public:
    SizeDigester() : DigesterBase(DigestKind::kSize) {}

    void update(std::span<const std::uint8_t> data) override {
        requireUnfinished();
        total_ += data.size();
    }

    std::vector<std::uint8_t> finish() override {
        markFinished();
        std::vector<std::uint8_t> out;
        appendBigEndian(out, total_);
        return out;
    }

private:
    std::uint64_t total_ = 0;
};

class WhirlpoolDigester final : public DigesterBase {
public:
    WhirlpoolDigester() : DigesterBase(DigestKind::kWhirlpool) {}

    void update(std::span<const std::uint8_t> data) override {
        requireUnfinished();
        hasher_.update(data);
    }

    std::vector<std::uint8_t> finish() override {
        markFinished();
        const auto digest = hasher_.finish();
        return {digest.begin(), digest.end()};
    }

private:
    Whirlpool hasher_;
};

}  // namespace

// =============================================================================
// Factories
// =============================================================================

bool openSslDigestAvailable(std::string_view algorithm) {
    return static_cast<bool>(fetchDigest(algorithm));
}

std::unique_ptr<Digester> makeOpenSslDigester(DigestKind kind, std::string_view algorithm) {
    UniqueMd md = fetchDigest(algorithm);
    if (!md) {
        throw UnsupportedDigestError(kind);
    }
    return std::make_unique<OpenSslDigester>(kind, std::move(md));
}

std::unique_ptr<Digester> makeZlibDigester(DigestKind kind) {
    if (kind != DigestKind::kCrc32 && kind != DigestKind::kAdler32) {
        throw UnsupportedDigestError(kind);
    }
    return std::make_unique<ZlibDigester>(kind);
}

std::unique_ptr<Digester> makeXxHashDigester(DigestKind kind) {
    switch (kind) {
        case DigestKind::kXxh64:
            return std::make_unique<Xxh64Digester>();
        case DigestKind::kXxh3:
            return std::make_unique<Xxh3Digester>();
        default:
            break;
    }
    throw UnsupportedDigestError(kind);
}

std::unique_ptr<Digester> makeSizeDigester() {
    return std::make_unique<SizeDigester>();
}

std::unique_ptr<Digester> makeWhirlpoolDigester() {
    return std::make_unique<WhirlpoolDigester>();
}

std::vector<std::uint8_t> digestBytes(Digester& digester, std::span<const std::uint8_t> data) {
    digester.update(data);
    return digester.finish();
}

}  // namespace pzk::chksum
