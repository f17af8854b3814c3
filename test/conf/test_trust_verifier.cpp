#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/conf/trust_verifier.hpp>

#include "../mocks/capture_sink.hpp"
#include "../support/bundle_fixture.hpp"

using namespace xrdinfo;
using namespace xrdinfo::testing;

namespace {

TimePoint At(const char* iso) {
    return *ParseIso8601(iso);
}

ConfigurationDirectory DirectoryOf(const SignedBundle& bundle) {
    return ParseDirectory(bundle.content_type, bundle.body).Value();
}

} // anonymous namespace

// ===========================================================================
// Signature
// ===========================================================================

TEST_CASE("TrustVerifier: accepts an RSA-signed bundle", "[conf][trust]") {
    auto verified = VerifyParts(RsaSigner(), {SharedParamsPart(), PrivateParamsPart()});
    REQUIRE(verified.IsOk());
    REQUIRE(verified.Value().size() == 2);
    CHECK(verified.Value()[0].Part().content_identifier == kSharedParametersId);
    CHECK_FALSE(verified.Value()[0].Stale());
}

TEST_CASE("TrustVerifier: accepts an ECDSA-signed bundle", "[conf][trust]") {
    auto verified = VerifyParts(EcSigner(), {SharedParamsPart()});
    REQUIRE(verified.IsOk());
    CHECK(verified.Value().size() == 1);
}

TEST_CASE("TrustVerifier: corrupted signature is a Trust error", "[conf][trust]") {
    BundleOptions options;
    options.corrupt_signature = true;
    auto verified = VerifyParts(RsaSigner(), {SharedParamsPart()}, options);
    REQUIRE(verified.IsErr());
    CHECK(verified.Error().category == ErrorCategory::Trust);
    CHECK(verified.Error().message == "Directory signature verification failed");
}

TEST_CASE("TrustVerifier: tampered directory is a Trust error", "[conf][trust]") {
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart()});
    auto directory = DirectoryOf(bundle);
    directory.signed_data[directory.signed_data.size() / 2] ^= 0x01;

    TrustVerifier verifier(RsaSigner().Anchor("EE", {kSourceUrl}));
    auto result = verifier.VerifySignature(directory);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Trust);
}

TEST_CASE("TrustVerifier: signer outside the anchor is a Trust error", "[conf][trust]") {
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart()});

    SECTION("certificate hash names an unknown certificate") {
        TrustVerifier verifier(EcSigner().Anchor("EE", {kSourceUrl}));
        auto result = verifier.VerifySignature(DirectoryOf(bundle));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message ==
              "Directory is signed by a certificate the anchor does not trust");
    }
    SECTION("no certificate hash, no anchor certificate verifies") {
        BundleOptions options;
        options.include_cert_hash = false;
        auto unhashed = BuildSignedBundle(RsaSigner(), {SharedParamsPart()}, options);
        TrustVerifier verifier(EcSigner().Anchor("EE", {kSourceUrl}));
        auto result = verifier.VerifySignature(DirectoryOf(unhashed));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Trust);
    }
}

TEST_CASE("TrustVerifier: without a certificate hash every anchor certificate is tried",
          "[conf][trust]") {
    BundleOptions options;
    options.include_cert_hash = false;
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart()}, options);

    std::vector<AnchorSource> sources{
        {"http://cs1.example.org", {EcSigner().CertificateDer()}},
        {"http://cs2.example.org", {RsaSigner().CertificateDer()}},
    };
    TrustVerifier verifier(ConfigurationAnchor("EE", sources));
    CHECK(verifier.VerifySignature(DirectoryOf(bundle)).IsOk());
}

TEST_CASE("TrustVerifier: anchor without certificates is a Trust error", "[conf][trust]") {
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart()});
    TrustVerifier verifier(ConfigurationAnchor::FromUrls("EE", {kSourceUrl}));
    auto result = verifier.VerifySignature(DirectoryOf(bundle));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Trust);
}

TEST_CASE("TrustVerifier: unsupported signature algorithm is a Trust error", "[conf][trust]") {
    auto directory = DirectoryOf(BuildSignedBundle(RsaSigner(), {SharedParamsPart()}));
    directory.signature_algorithm = "http://example.org/dsa-md5";
    TrustVerifier verifier(RsaSigner().Anchor("EE", {kSourceUrl}));
    auto result = verifier.VerifySignature(directory);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Trust);
}

// ===========================================================================
// Parts
// ===========================================================================

TEST_CASE("TrustVerifier: one flipped content byte is an Integrity error", "[conf][trust]") {
    std::vector<BundlePart> parts{SharedParamsPart()};
    auto bundle = BuildSignedBundle(RsaSigner(), parts);
    auto directory = DirectoryOf(bundle);

    auto contents = ContentByLocation(parts);
    auto& content = contents.begin()->second;
    content[content.size() / 2] ^= 0x01;

    TrustVerifier verifier(RsaSigner().Anchor("EE", {kSourceUrl}));
    auto result = verifier.Verify(directory, AttachContent(directory, contents).Value());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Integrity);
    CHECK(result.Error().endpoint == "/V2/20240501/shared-params.xml");
    CHECK(result.Error().ExitCode() == 4);
}

TEST_CASE("TrustVerifier: part of a foreign instance is a Trust error", "[conf][trust]") {
    auto part = SharedParamsPart();
    part.instance = "LV";
    auto verified = VerifyParts(RsaSigner(), {part});
    REQUIRE(verified.IsErr());
    CHECK(verified.Error().category == ErrorCategory::Trust);
    CHECK(verified.Error().message.find("unknown instance 'LV'") != std::string::npos);
}

TEST_CASE("TrustVerifier: every supported digest algorithm verifies", "[conf][trust]") {
    for (const char* algorithm : {algorithm_uri::kSha256, algorithm_uri::kSha384,
                                  algorithm_uri::kSha512}) {
        BundleOptions options;
        options.digest_algorithm = algorithm;
        CHECK(VerifyParts(RsaSigner(), {SharedParamsPart()}, options).IsOk());
    }
}

// ===========================================================================
// Expiration
// ===========================================================================

TEST_CASE("TrustVerifier: expired part is returned flagged stale", "[conf][trust]") {
    auto [logger, sink] = MakeCaptureLogger();
    TrustVerifierOptions options{[] { return At("2100-01-01T00:00:00Z"); }, logger};

    auto verified = VerifyParts(RsaSigner(), {SharedParamsPart()}, {}, options);
    REQUIRE(verified.IsOk());
    CHECK(verified.Value()[0].Stale());
    CHECK(sink->Count(LogLevel::Warn) == 1);
    CHECK(sink->Contains("expired at 2099-01-01T00:00:00Z"));
}

TEST_CASE("TrustVerifier: staleness is judged per part", "[conf][trust]") {
    auto fresh = SharedParamsPart();
    auto expired = PrivateParamsPart();
    expired.expire_date = "2024-01-01T00:00:00Z";
    TrustVerifierOptions options{[] { return At("2025-01-01T00:00:00Z"); }, nullptr};

    auto verified = VerifyParts(RsaSigner(), {fresh, expired}, {}, options);
    REQUIRE(verified.IsOk());
    CHECK_FALSE(verified.Value()[0].Stale());
    CHECK(verified.Value()[1].Stale());
}

TEST_CASE("TrustVerifier: part without expiration is never stale", "[conf][trust]") {
    BundleOptions bundle_options;
    bundle_options.expire_date = std::nullopt;
    TrustVerifierOptions options{[] { return At("2999-01-01T00:00:00Z"); }, nullptr};

    auto verified = VerifyParts(RsaSigner(), {SharedParamsPart()}, bundle_options, options);
    REQUIRE(verified.IsOk());
    CHECK_FALSE(verified.Value()[0].Stale());
}
