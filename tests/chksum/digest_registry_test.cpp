// =============================================================================
// pzkit - Digest Provider Registry Tests
// =============================================================================
// Provider selection per digest kind, known-answer digests for every backend,
// and digest list parsing.
// =============================================================================

#include "pzk/chksum/digest_registry.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pzk/chksum/whirlpool.h"

namespace pzk::chksum {
namespace {

std::span<const std::uint8_t> asBytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

std::string hexOf(DigestKind kind, std::string_view text,
                  const DigestRegistry& registry = DigestRegistry::instance()) {
    auto digester = registry.resolve(kind).createDigester();
    return formatDigest(kind, digestBytes(*digester, asBytes(text)));
}

// =============================================================================
// Known Answer Tests
// =============================================================================

struct KnownAnswer {
    DigestKind kind;
    std::string_view input;
    std::string_view expected;
};

class KnownAnswerTest : public ::testing::TestWithParam<KnownAnswer> {};

TEST_P(KnownAnswerTest, MatchesReference) {
    const auto& answer = GetParam();
    EXPECT_EQ(hexOf(answer.kind, answer.input), answer.expected);
}

INSTANTIATE_TEST_SUITE_P(
    Check123456789, KnownAnswerTest,
    ::testing::Values(
        KnownAnswer{DigestKind::kMd5, "123456789", "25f9e794323b453885f5181f1b624d0b"},
        KnownAnswer{DigestKind::kSha1, "123456789", "f7c3bc1d808e04732adf679965ccc34ca7ae3441"},
        KnownAnswer{DigestKind::kSha256, "123456789",
                    "15e2b0d3c33891ebb0f1ef609ec419420c20e320ce94c65fbc8c3312448eb225"},
        KnownAnswer{DigestKind::kSha512, "123456789",
                    "d9e6762dd1c8eaf6d61b3c6192fc408d4d6d5f1176d0c29169bc24e71c3f274a"
                    "d27fcd5811b313d681f7e55ec02d73d499c95455b6b5bb503acf574fba8ffe85"},
        KnownAnswer{DigestKind::kSha3_256, "123456789",
                    "87cd084d190e436f147322b90e7384f6a8e0676c99d21ef519ea718e51d45f9c"},
        KnownAnswer{DigestKind::kSha3_512, "123456789",
                    "e1e44d20556e97a180b6dd3ed7ae5c465cafd553fa8747dca038fb95635b77a3"
                    "7318f7ddf7aec1f6c3c14bb160ba2497007decf38dd361cab199e3b8c8fe1f5c"},
        KnownAnswer{DigestKind::kBlake2b, "123456789",
                    "f5ab8bafa6f2f72b431188ac38ae2de7bb618fb3d38b6cbf639defcdd5e10a86"
                    "b22fccff571da37e42b23b80b657ee4d936478f582280a87d6dbb1da73f5c47d"},
        KnownAnswer{DigestKind::kBlake2s, "123456789",
                    "7acc2dd21a2909140507f37396acce906864b5f118dfa766b107962b7a82a0d4"},
        KnownAnswer{DigestKind::kCrc32, "123456789", "cbf43926"},
        KnownAnswer{DigestKind::kAdler32, "123456789", "091e01de"},
        KnownAnswer{DigestKind::kSize, "123456789", "9"}));

INSTANTIATE_TEST_SUITE_P(
    EmptyInput, KnownAnswerTest,
    ::testing::Values(KnownAnswer{DigestKind::kCrc32, "", "00000000"},
                      KnownAnswer{DigestKind::kAdler32, "", "00000001"},
                      KnownAnswer{DigestKind::kXxh64, "", "ef46db3751d8e999"},
                      KnownAnswer{DigestKind::kXxh3, "", "2d06800538d394c2"},
                      KnownAnswer{DigestKind::kSize, "", "0"},
                      KnownAnswer{
                          DigestKind::kWhirlpool, "",
                          "19fa61d75522a4669b44e39c1d2e1726c530232130d407f89afee0964997f7a7"
                          "3e83be698b288febcf88e3e03c4f0757ea8964e59b63d93708b138cc42a66eb3"}));

// =============================================================================
// Provider Selection Tests
// =============================================================================

TEST(DigestRegistryTest, EveryKindIsSupportedByDefault) {
    const auto& registry = DigestRegistry::instance();
    for (DigestKind kind : kAllDigestKinds) {
        EXPECT_TRUE(registry.supports(kind)) << digestName(kind);
    }
    EXPECT_EQ(registry.available().size(), std::size(kAllDigestKinds));
}

TEST(DigestRegistryTest, PrefersAcceleratedImplementations) {
    const auto& sha256 = DigestRegistry::instance().resolve(DigestKind::kSha256);
    EXPECT_EQ(sha256.backend, DigestBackend::kOpenSsl);
    EXPECT_EQ(sha256.implementationSource, ImplementationSource::kNativeAccelerated);
    EXPECT_EQ(sha256.algorithm, "SHA2-256");
    EXPECT_TRUE(sha256.releasesExclusiveLock);

    const auto& crc32 = DigestRegistry::instance().resolve(DigestKind::kCrc32);
    EXPECT_EQ(crc32.backend, DigestBackend::kZlib);
    EXPECT_EQ(crc32.implementationSource, ImplementationSource::kNativeStandard);
    EXPECT_TRUE(crc32.releasesExclusiveLock);

    const auto& size = DigestRegistry::instance().resolve(DigestKind::kSize);
    EXPECT_EQ(size.backend, DigestBackend::kBuiltin);
    EXPECT_TRUE(size.releasesExclusiveLock);
}

TEST(DigestRegistryTest, FallbackOnlyRegistry) {
    const DigestRegistry registry(DigestRegistry::Options{false, false, true});

    EXPECT_EQ(registry.available(),
              (std::vector<DigestKind>{DigestKind::kSize, DigestKind::kWhirlpool}));

    const auto& whirlpool = registry.resolve(DigestKind::kWhirlpool);
    EXPECT_EQ(whirlpool.backend, DigestBackend::kBuiltin);
    EXPECT_EQ(whirlpool.implementationSource, ImplementationSource::kPureFallback);
    EXPECT_TRUE(whirlpool.releasesExclusiveLock);

    EXPECT_THROW((void)registry.resolve(DigestKind::kSha256), UnsupportedDigestError);
}

TEST(DigestRegistryTest, WhirlpoolAgreesAcrossImplementations) {
    const DigestRegistry fallback(DigestRegistry::Options{false, false, true});
    const std::string text = "The quick brown fox jumps over the lazy dog";
    EXPECT_EQ(hexOf(DigestKind::kWhirlpool, text),
              hexOf(DigestKind::kWhirlpool, text, fallback));
}

TEST(DigestRegistryTest, DisallowedTierIsUnsupported) {
    const DigestRegistry registry(DigestRegistry::Options{true, true, false});
    EXPECT_FALSE(registry.supports(DigestKind::kSize));
    EXPECT_TRUE(registry.supports(DigestKind::kXxh3));
    try {
        (void)registry.resolve(DigestKind::kSize);
        FAIL() << "expected UnsupportedDigestError";
    } catch (const UnsupportedDigestError& e) {
        EXPECT_EQ(e.digestName(), "size");
        EXPECT_EQ(e.code(), ErrorCode::kUnsupportedDigest);
    }
}

TEST(DigestRegistryTest, CandidatesAreOrderedBestFirst) {
    for (DigestKind kind : kAllDigestKinds) {
        bool seen = false;
        ImplementationSource previous = ImplementationSource::kNativeAccelerated;
        for (const auto& candidate : digestCandidates()) {
            if (candidate.kind != kind) {
                continue;
            }
            if (seen) {
                EXPECT_LE(previous, candidate.source) << digestName(kind);
            }
            previous = candidate.source;
            seen = true;
        }
        EXPECT_TRUE(seen) << digestName(kind) << " has no candidate";
    }
}

TEST(DigestRegistryTest, ProcessWideInstanceIsShared) {
    EXPECT_EQ(&DigestRegistry::instance(), &DigestRegistry::instance());
}

// =============================================================================
// Digester Tests
// =============================================================================

TEST(DigesterTest, FinishTwiceIsInvalid) {
    for (DigestKind kind : {DigestKind::kSha1, DigestKind::kCrc32, DigestKind::kXxh64,
                            DigestKind::kSize, DigestKind::kWhirlpool}) {
        auto digester = DigestRegistry::instance().resolve(kind).createDigester();
        digester->update(asBytes("x"));
        (void)digester->finish();
        EXPECT_THROW((void)digester->finish(), InvalidStateError) << digestName(kind);
        EXPECT_THROW(digester->update(asBytes("y")), InvalidStateError) << digestName(kind);
    }
}

TEST(DigesterTest, KindMatchesDescriptor) {
    for (DigestKind kind : DigestRegistry::instance().available()) {
        EXPECT_EQ(DigestRegistry::instance().resolve(kind).createDigester()->kind(), kind);
    }
}

TEST(DigesterTest, UnknownOpenSslAlgorithmIsUnsupported) {
    EXPECT_FALSE(openSslDigestAvailable("NOT-A-DIGEST"));
    EXPECT_TRUE(openSslDigestAvailable("SHA2-256"));
    EXPECT_THROW((void)makeOpenSslDigester(DigestKind::kSha256, "NOT-A-DIGEST"),
                 UnsupportedDigestError);
}

TEST(DigesterTest, DigestLengths) {
    const std::vector<std::pair<DigestKind, std::size_t>> lengths = {
        {DigestKind::kSize, 8},    {DigestKind::kCrc32, 4},      {DigestKind::kAdler32, 4},
        {DigestKind::kXxh64, 8},   {DigestKind::kXxh3, 8},       {DigestKind::kMd5, 16},
        {DigestKind::kSha1, 20},   {DigestKind::kSha256, 32},    {DigestKind::kSha512, 64},
        {DigestKind::kBlake2b, 64}, {DigestKind::kBlake2s, 32},  {DigestKind::kWhirlpool, 64}};
    for (const auto& [kind, length] : lengths) {
        auto digester = DigestRegistry::instance().resolve(kind).createDigester();
        EXPECT_EQ(digestBytes(*digester, asBytes("abc")).size(), length) << digestName(kind);
    }
}

RC_GTEST_PROP(DigesterProperty, ChunkedUpdatesMatchOneShot,
              (const std::vector<std::uint8_t>& data)) {
    const auto kind = *rc::gen::elementOf(DigestRegistry::instance().available());
    const auto chunk = *rc::gen::inRange<std::size_t>(1, 64);
    const auto& descriptor = DigestRegistry::instance().resolve(kind);

    auto whole = descriptor.createDigester();
    const auto expected = digestBytes(*whole, data);

    auto pieces = descriptor.createDigester();
    const std::span<const std::uint8_t> bytes(data);
    for (std::size_t offset = 0; offset < bytes.size(); offset += chunk) {
        pieces->update(bytes.subspan(offset, std::min(chunk, bytes.size() - offset)));
    }
    RC_ASSERT(pieces->finish() == expected);
}

// =============================================================================
// Formatting and Parsing Tests
// =============================================================================

TEST(FormatDigestTest, HexIsLowercase) {
    const std::vector<std::uint8_t> bytes{0xAB, 0x01, 0xFF};
    EXPECT_EQ(formatDigest(DigestKind::kSha256, bytes), "ab01ff");
}

TEST(FormatDigestTest, SizeIsDecimal) {
    const std::vector<std::uint8_t> bytes{0, 0, 0, 0, 0, 0, 0x01, 0x00};
    EXPECT_EQ(formatDigest(DigestKind::kSize, bytes), "256");
}

TEST(ParseDigestListTest, KeepsOrderAndDropsDuplicates) {
    EXPECT_EQ(parseDigestList("sha256,md5,SHA256"),
              (std::vector<DigestKind>{DigestKind::kSha256, DigestKind::kMd5}));
}

TEST(ParseDigestListTest, ToleratesSpacesAndEmptyEntries) {
    EXPECT_EQ(parseDigestList(" crc32 ,, sha3-256 ,"),
              (std::vector<DigestKind>{DigestKind::kCrc32, DigestKind::kSha3_256}));
    EXPECT_TRUE(parseDigestList("").empty());
}

TEST(ParseDigestListTest, UnknownNameIsReported) {
    try {
        (void)parseDigestList("sha256,sha384");
        FAIL() << "expected UnsupportedDigestError";
    } catch (const UnsupportedDigestError& e) {
        EXPECT_EQ(e.digestName(), "sha384");
    }
}

TEST(DigestBackendTest, Names) {
    EXPECT_EQ(digestBackendName(DigestBackend::kOpenSsl), "openssl");
    EXPECT_EQ(digestBackendName(DigestBackend::kXxHash), "xxhash");
}

}  // namespace
}  // namespace pzk::chksum
