// =============================================================================
// pzkit - Digest Provider Registry Implementation
// =============================================================================

#include "pzk/chksum/digest_registry.h"

#include <openssl/err.h>
#include <openssl/provider.h>

#include <algorithm>
#include <mutex>

#include "pzk/common/logger.h"

namespace pzk::chksum {

namespace {

constexpr DigestCandidate kCandidates[] = {
    {DigestKind::kMd5, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "MD5"},
    {DigestKind::kSha1, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "SHA1"},
    {DigestKind::kSha256, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "SHA2-256"},
    {DigestKind::kSha512, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "SHA2-512"},
    {DigestKind::kSha3_256, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "SHA3-256"},
    {DigestKind::kSha3_512, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "SHA3-512"},
    {DigestKind::kBlake2b, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "BLAKE2B-512"},
    {DigestKind::kBlake2s, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "BLAKE2S-256"},
    {DigestKind::kWhirlpool, DigestBackend::kOpenSsl, ImplementationSource::kNativeAccelerated,
     "WHIRLPOOL"},
    {DigestKind::kWhirlpool, DigestBackend::kBuiltin, ImplementationSource::kPureFallback,
     ""},
    {DigestKind::kXxh64, DigestBackend::kXxHash, ImplementationSource::kNativeStandard,
     ""},
    {DigestKind::kXxh3, DigestBackend::kXxHash, ImplementationSource::kNativeStandard,
     ""},
    {DigestKind::kCrc32, DigestBackend::kZlib, ImplementationSource::kNativeStandard,
     ""},
    {DigestKind::kAdler32, DigestBackend::kZlib, ImplementationSource::kNativeStandard,
     ""},
    {DigestKind::kSize, DigestBackend::kBuiltin, ImplementationSource::kPureFallback,
     ""},
};

/// @brief Make legacy-provider digests (WHIRLPOOL) fetchable, once per process.
void loadLegacyProviderOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        // retain_fallbacks=1 keeps the default provider active
        OSSL_PROVIDER* legacy = OSSL_PROVIDER_try_load(nullptr, "legacy", 1);
        if (legacy == nullptr) {
            ERR_clear_error();
            PZK_LOG_DEBUG("OpenSSL legacy provider not available");
            return;
        }
        PZK_LOG_DEBUG("OpenSSL legacy provider loaded");
    });
}

bool candidateAvailable(const DigestCandidate& candidate) {
    if (candidate.backend != DigestBackend::kOpenSsl) {
        return true;
    }
    return openSslDigestAvailable(candidate.algorithm);
}

}  // namespace

std::string_view digestBackendName(DigestBackend backend) noexcept {
    switch (backend) {
        case DigestBackend::kOpenSsl:
            return "openssl";
        case DigestBackend::kZlib:
            return "zlib";
        case DigestBackend::kXxHash:
            return "xxhash";
        case DigestBackend::kBuiltin:
            return "builtin";
    }
    return "unknown";
}

std::span<const DigestCandidate> digestCandidates() {
    return kCandidates;
}

// =============================================================================
// DigestDescriptor Implementation
// =============================================================================

std::unique_ptr<Digester> DigestDescriptor::createDigester() const {
    switch (backend) {
        case DigestBackend::kOpenSsl:
            return makeOpenSslDigester(digestKind, algorithm);
        case DigestBackend::kZlib:
            return makeZlibDigester(digestKind);
        case DigestBackend::kXxHash:
            return makeXxHashDigester(digestKind);
        case DigestBackend::kBuiltin:
            if (digestKind == DigestKind::kSize) {
                return makeSizeDigester();
            }
            if (digestKind == DigestKind::kWhirlpool) {
                return makeWhirlpoolDigester();
            }
            break;
    }
    throw UnsupportedDigestError(digestKind);
}

// =============================================================================
// DigestRegistry Implementation
// =============================================================================

DigestRegistry::DigestRegistry() : DigestRegistry(Options{}) {}

DigestRegistry::DigestRegistry(Options options) : options_(options) {
    if (options_.allowAccelerated) {
        loadLegacyProviderOnce();
    }

    for (const DigestCandidate& candidate : kCandidates) {
        if (resolved_.contains(candidate.kind) || !allows(candidate.source)) {
            continue;
        }
        if (!candidateAvailable(candidate)) {
            PZK_LOG_DEBUG("Digest candidate {}/{} unavailable", digestName(candidate.kind),
                          digestBackendName(candidate.backend));
            continue;
        }

        DigestDescriptor descriptor;
        descriptor.digestKind = candidate.kind;
        descriptor.implementationSource = candidate.source;
        descriptor.backend = candidate.backend;
        descriptor.algorithm = std::string(candidate.algorithm);
        // Every digester owns its state, builtins included.
        descriptor.releasesExclusiveLock = true;
        resolved_.emplace(candidate.kind, std::move(descriptor));

        PZK_LOG_DEBUG("Digest {} -> {} ({})", digestName(candidate.kind),
                      digestBackendName(candidate.backend),
                      implementationSourceName(candidate.source));
    }
}

const DigestRegistry& DigestRegistry::instance() {
    static std::once_flag once;
    static std::unique_ptr<DigestRegistry> registry;

    std::call_once(once, []() { registry = std::make_unique<DigestRegistry>(); });
    return *registry;
}

bool DigestRegistry::allows(ImplementationSource source) const noexcept {
    switch (source) {
        case ImplementationSource::kNativeAccelerated:
            return options_.allowAccelerated;
        case ImplementationSource::kNativeStandard:
            return options_.allowStandard;
        case ImplementationSource::kPureFallback:
            return options_.allowFallback;
    }
    return false;
}

const DigestDescriptor& DigestRegistry::resolve(DigestKind kind) const {
    auto it = resolved_.find(kind);
    if (it == resolved_.end()) {
        throw UnsupportedDigestError(kind);
    }
    return it->second;
}

bool DigestRegistry::supports(DigestKind kind) const noexcept {
    return resolved_.contains(kind);
}

std::vector<DigestKind> DigestRegistry::available() const {
    std::vector<DigestKind> kinds;
    for (DigestKind kind : kAllDigestKinds) {
        if (supports(kind)) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

// =============================================================================
// Formatting
// =============================================================================

std::string formatDigest(DigestKind kind, std::span<const std::uint8_t> bytes) {
    if (kind == DigestKind::kSize) {
        std::uint64_t total = 0;
        for (std::uint8_t byte : bytes) {
            total = (total << 8) | byte;
        }
        return std::to_string(total);
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t byte : bytes) {
        out.push_back(kHex[(byte >> 4) & 0x0F]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

std::vector<DigestKind> parseDigestList(std::string_view list) {
    std::vector<DigestKind> kinds;
    std::size_t start = 0;
    while (start <= list.size()) {
        auto end = list.find(',', start);
        if (end == std::string_view::npos) {
            end = list.size();
        }
        std::string_view name = list.substr(start, end - start);
        while (!name.empty() && name.front() == ' ') {
            name.remove_prefix(1);
        }
        while (!name.empty() && name.back() == ' ') {
            name.remove_suffix(1);
        }
        if (!name.empty()) {
            auto kind = parseDigestKind(name);
            if (!kind.has_value()) {
                throw UnsupportedDigestError(std::string(name));
            }
            if (std::find(kinds.begin(), kinds.end(), *kind) == kinds.end()) {
                kinds.push_back(*kind);
            }
        }
        start = end + 1;
    }
    return kinds;
}

}  // namespace pzk::chksum
