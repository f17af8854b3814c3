#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/conf/global_conf.hpp>

#include "../mocks/capture_sink.hpp"
#include "../support/bundle_fixture.hpp"

using namespace xrdinfo;
using namespace xrdinfo::testing;
using namespace std::chrono_literals;

TEST_CASE("LoadGlobalConfiguration: fetches verifies and indexes", "[conf][global]") {
    MockHttpTransport mock;
    std::vector<BundlePart> parts{SharedParamsPart(), PrivateParamsPart()};
    RouteBundle(mock, kSourceUrl, BuildSignedBundle(RsaSigner(), parts), parts);

    auto conf = LoadGlobalConfiguration(mock, RsaSigner().Anchor("EE", {kSourceUrl}));
    REQUIRE(conf.IsOk());
    CHECK(conf.Value().source_url == kSourceUrl);
    CHECK(conf.Value().parts.size() == 2);
    CHECK_FALSE(conf.Value().stale);
    CHECK(conf.Value().shared_params.Members().size() == 3);
    CHECK(conf.Value().shared_params.Instance() == "EE");
}

TEST_CASE("LoadGlobalConfiguration: expired configuration loads as stale", "[conf][global]") {
    MockHttpTransport mock;
    std::vector<BundlePart> parts{SharedParamsPart()};
    RouteBundle(mock, kSourceUrl, BuildSignedBundle(RsaSigner(), parts), parts);

    auto [logger, sink] = MakeCaptureLogger();
    LoadOptions options;
    options.clock = [] { return *ParseIso8601("2100-01-01T00:00:00Z"); };
    options.logger = logger;

    auto conf = LoadGlobalConfiguration(mock, RsaSigner().Anchor("EE", {kSourceUrl}), options);
    REQUIRE(conf.IsOk());
    CHECK(conf.Value().stale);
    CHECK(conf.Value().parts[0].Stale());
    CHECK(sink->Contains("Global configuration is expired"));
}

TEST_CASE("LoadGlobalConfiguration: tampered content aborts the load", "[conf][global]") {
    MockHttpTransport mock;
    std::vector<BundlePart> parts{SharedParamsPart()};
    auto bundle = BuildSignedBundle(RsaSigner(), parts);
    parts[0].content += " ";
    RouteBundle(mock, kSourceUrl, bundle, parts);

    auto conf = LoadGlobalConfiguration(mock, RsaSigner().Anchor("EE", {kSourceUrl}));
    REQUIRE(conf.IsErr());
    CHECK(conf.Error().category == ErrorCategory::Integrity);
}

TEST_CASE("LoadGlobalConfiguration: untrusted signer aborts the load", "[conf][global]") {
    MockHttpTransport mock;
    std::vector<BundlePart> parts{SharedParamsPart()};
    RouteBundle(mock, kSourceUrl, BuildSignedBundle(RsaSigner(), parts), parts);

    auto conf = LoadGlobalConfiguration(mock, EcSigner().Anchor("EE", {kSourceUrl}));
    REQUIRE(conf.IsErr());
    CHECK(conf.Error().category == ErrorCategory::Trust);
}

TEST_CASE("LoadGlobalConfiguration: bundle without shared parameters", "[conf][global]") {
    MockHttpTransport mock;
    std::vector<BundlePart> parts{PrivateParamsPart()};
    RouteBundle(mock, kSourceUrl, BuildSignedBundle(RsaSigner(), parts), parts);

    auto conf = LoadGlobalConfiguration(mock, RsaSigner().Anchor("EE", {kSourceUrl}));
    REQUIRE(conf.IsErr());
    CHECK(conf.Error().category == ErrorCategory::Format);
    CHECK(conf.Error().message == "Configuration has no shared parameters for instance EE");
}

TEST_CASE("LoadGlobalConfiguration: unreachable sources are a Network error",
          "[conf][global]") {
    MockHttpTransport mock;
    LoadOptions options;
    options.timeout = 2s;

    auto conf = LoadGlobalConfiguration(
        mock, RsaSigner().Anchor("EE", {"http://cs1.example.org", "http://cs2.example.org"}),
        options);
    REQUIRE(conf.IsErr());
    CHECK(conf.Error().category == ErrorCategory::Network);
    REQUIRE(mock.GetCallCount() == 2);
    CHECK(mock.GetCalls()[0].timeout == 2s);
    CHECK(mock.GetCalls()[1].url == "http://cs2.example.org/internalconf");
}
