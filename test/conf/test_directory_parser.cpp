#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/conf/directory_parser.hpp>

#include "../support/bundle_fixture.hpp"

using namespace xrdinfo;
using namespace xrdinfo::testing;

TEST_CASE("ParseDirectory: reads entries and signature", "[conf][directory]") {
    std::vector<BundlePart> parts{SharedParamsPart(), PrivateParamsPart()};
    parts[0].version = "2";
    auto bundle = BuildSignedBundle(RsaSigner(), parts);

    auto directory = ParseDirectory(bundle.content_type, bundle.body);
    REQUIRE(directory.IsOk());
    const auto& dir = directory.Value();

    CHECK(dir.signed_data == bundle.signed_data);
    CHECK(dir.version == std::optional<std::string>("2"));
    REQUIRE(dir.expiration.has_value());
    CHECK(FormatIso8601(*dir.expiration) == "2099-01-01T00:00:00Z");

    REQUIRE(dir.entries.size() == 2);
    CHECK(dir.entries[0].content_identifier == kSharedParametersId);
    CHECK(dir.entries[0].instance == "EE");
    CHECK(dir.entries[0].location == "/V2/20240501/shared-params.xml");
    CHECK(dir.entries[0].digest_algorithm == algorithm_uri::kSha512);
    CHECK(dir.entries[0].version == std::optional<std::string>("2"));
    CHECK(dir.entries[1].content_identifier == kPrivateParametersId);
    CHECK_FALSE(dir.entries[1].version.has_value());

    CHECK(dir.signature_algorithm == RsaSigner().SignatureAlgorithm());
    CHECK_FALSE(dir.signature.empty());
    CHECK_FALSE(dir.verification_cert_hash.empty());
    CHECK(dir.verification_cert_hash_algorithm == algorithm_uri::kSha512);
}

TEST_CASE("ParseDirectory: entry offsets point into the signed data", "[conf][directory]") {
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart(), PrivateParamsPart()});
    auto dir = ParseDirectory(bundle.content_type, bundle.body).Value();

    for (const auto& entry : dir.entries) {
        auto slice = dir.signed_data.substr(entry.offset, entry.length);
        CHECK(slice.find("Content-location: " + entry.location) != std::string::npos);
        CHECK(slice.substr(slice.size() - entry.digest_value.size()) == entry.digest_value);
    }
}

TEST_CASE("ParseDirectory: per-entry Expire-date overrides the directory", "[conf][directory]") {
    auto part = SharedParamsPart();
    part.expire_date = "2030-06-01T12:00:00Z";
    auto bundle = BuildSignedBundle(RsaSigner(), {part, PrivateParamsPart()});
    auto dir = ParseDirectory(bundle.content_type, bundle.body).Value();

    CHECK(FormatIso8601(*dir.entries[0].expiration) == "2030-06-01T12:00:00Z");
    CHECK(FormatIso8601(*dir.entries[1].expiration) == "2099-01-01T00:00:00Z");
}

TEST_CASE("ParseDirectory: boundary falls back to the body", "[conf][directory]") {
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart()});
    auto directory = ParseDirectory("", bundle.body);
    REQUIRE(directory.IsOk());
    CHECK(directory.Value().entries.size() == 1);
}

TEST_CASE("ParseDirectory: malformed bundles are Format errors", "[conf][directory]") {
    SECTION("no boundary anywhere") {
        auto directory = ParseDirectory("text/plain", "hello");
        REQUIRE(directory.IsErr());
        CHECK(directory.Error().category == ErrorCategory::Format);
    }
    SECTION("signature part missing") {
        const std::string body =
            "--outer\r\n"
            "Content-Type: multipart/mixed; boundary=inner\r\n\r\n"
            "--inner--\r\n"
            "--outer--\r\n";
        auto directory = ParseDirectory("multipart/related; boundary=outer", body);
        REQUIRE(directory.IsErr());
        CHECK(directory.Error().category == ErrorCategory::Format);
    }
    SECTION("entry without Hash-algorithm-id") {
        const std::string body =
            "--outer\r\n"
            "Content-Type: multipart/mixed; boundary=inner\r\n\r\n"
            "--inner\r\n"
            "Content-Identifier: SHARED-PARAMETERS; instance=\"EE\"\r\n"
            "Content-location: /shared-params.xml\r\n\r\n"
            "AAAA\r\n"
            "--inner--\r\n"
            "--outer\r\n"
            "Signature-algorithm-id: x\r\n\r\n"
            "AAAA\r\n"
            "--outer--\r\n";
        auto directory = ParseDirectory("multipart/related; boundary=outer", body);
        REQUIRE(directory.IsErr());
        CHECK(directory.Error().message ==
              "Directory entry 1 lacks the Hash-algorithm-id header");
    }
    SECTION("Content-Identifier without instance") {
        const std::string body =
            "--outer\r\n"
            "Content-Type: multipart/mixed; boundary=inner\r\n\r\n"
            "--inner\r\n"
            "Content-Identifier: SHARED-PARAMETERS\r\n"
            "Content-location: /shared-params.xml\r\n"
            "Hash-algorithm-id: http://www.w3.org/2001/04/xmlenc#sha512\r\n\r\n"
            "AAAA\r\n"
            "--inner--\r\n"
            "--outer\r\n"
            "Signature-algorithm-id: x\r\n\r\n"
            "AAAA\r\n"
            "--outer--\r\n";
        auto directory = ParseDirectory("multipart/related; boundary=outer", body);
        REQUIRE(directory.IsErr());
        CHECK(directory.Error().category == ErrorCategory::Format);
    }
    SECTION("unparseable Expire-date") {
        BundleOptions options;
        options.expire_date = "next tuesday";
        auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart()}, options);
        auto directory = ParseDirectory(bundle.content_type, bundle.body);
        REQUIRE(directory.IsErr());
        CHECK(directory.Error().message == "Invalid Expire-date 'next tuesday'");
    }
}

TEST_CASE("AttachContent: pairs entries with fetched bytes", "[conf][directory]") {
    std::vector<BundlePart> parts{SharedParamsPart(), PrivateParamsPart()};
    auto bundle = BuildSignedBundle(RsaSigner(), parts);
    auto dir = ParseDirectory(bundle.content_type, bundle.body).Value();

    auto attached = AttachContent(dir, ContentByLocation(parts));
    REQUIRE(attached.IsOk());
    REQUIRE(attached.Value().size() == 2);
    CHECK(attached.Value()[0].raw_bytes == parts[0].content);
    CHECK(attached.Value()[1].location == parts[1].location);
    CHECK(attached.Value()[0].directory_length == dir.entries[0].length);
}

TEST_CASE("AttachContent: missing content is a Format error", "[conf][directory]") {
    auto bundle = BuildSignedBundle(RsaSigner(), {SharedParamsPart(), PrivateParamsPart()});
    auto dir = ParseDirectory(bundle.content_type, bundle.body).Value();

    auto attached = AttachContent(dir, ContentByLocation({SharedParamsPart()}));
    REQUIRE(attached.IsErr());
    CHECK(attached.Error().category == ErrorCategory::Format);
    CHECK(attached.Error().endpoint == "/V2/20240501/private-params.xml");
}
