#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/core/url.hpp>

using namespace xrdinfo;

TEST_CASE("UrlEncode: unreserved characters pass through", "[core][url]") {
    CHECK(UrlEncode("getPerson-v1_x.y~z") == "getPerson-v1_x.y~z");
    CHECK(UrlEncode("") == "");
}

TEST_CASE("UrlEncode: reserved characters are percent-encoded", "[core][url]") {
    CHECK(UrlEncode("path/with/slash") == "path%2Fwith%2Fslash");
    CHECK(UrlEncode("a b") == "a%20b");
    CHECK(UrlEncode("x=1&y") == "x%3D1%26y");
}

TEST_CASE("UrlEncode: non-ASCII bytes are encoded individually", "[core][url]") {
    CHECK(UrlEncode("\xC3\xBC") == "%C3%BC");
}

TEST_CASE("UrlDecode: reverses UrlEncode", "[core][url]") {
    CHECK(UrlDecode("path%2Fwith%2Fslash") == "path/with/slash");
    CHECK(UrlDecode("%c3%bc") == "\xC3\xBC");
}

TEST_CASE("UrlDecode: keeps malformed sequences and plus", "[core][url]") {
    CHECK(UrlDecode("100%") == "100%");
    CHECK(UrlDecode("%zz") == "%zz");
    CHECK(UrlDecode("a+b") == "a+b");
}

TEST_CASE("SplitUrl: scheme authority and path", "[core][url]") {
    auto parts = SplitUrl("https://ss1.example.org:8443/r1/EE/GOV/1?x=1");
    CHECK(parts.scheme == "https");
    CHECK(parts.authority == "ss1.example.org:8443");
    CHECK(parts.path_query == "/r1/EE/GOV/1?x=1");
    CHECK(parts.Origin() == "https://ss1.example.org:8443");
}

TEST_CASE("SplitUrl: bare host has no path", "[core][url]") {
    auto parts = SplitUrl("http://cs.example.org");
    CHECK(parts.authority == "cs.example.org");
    CHECK(parts.path_query.empty());
}

TEST_CASE("SplitUrl: query without path gets a slash", "[core][url]") {
    CHECK(SplitUrl("http://gw?a=b").path_query == "/?a=b");
}

TEST_CASE("AddUrlScheme: picks scheme by TLS", "[core][url]") {
    CHECK(AddUrlScheme("cs.example.org", false) == "http://cs.example.org");
    CHECK(AddUrlScheme("cs.example.org", true) == "https://cs.example.org");
    CHECK(AddUrlScheme("https://cs.example.org", false) == "https://cs.example.org");
}

TEST_CASE("WithDefaultPath: appends only when path is missing", "[core][url]") {
    CHECK(WithDefaultPath("http://cs", "internalconf") == "http://cs/internalconf");
    CHECK(WithDefaultPath("http://cs/", "internalconf") == "http://cs/internalconf");
    CHECK(WithDefaultPath("http://cs/externalconf", "internalconf") ==
          "http://cs/externalconf");
}

TEST_CASE("ResolveUrl: absolute path resolves against the origin", "[core][url]") {
    CHECK(ResolveUrl("http://cs.example.org/internalconf",
                     "/V2/20240501/shared-params.xml") ==
          "http://cs.example.org/V2/20240501/shared-params.xml");
}

TEST_CASE("ResolveUrl: absolute URL is returned unchanged", "[core][url]") {
    CHECK(ResolveUrl("http://a/internalconf", "http://b/conf/x.xml") ==
          "http://b/conf/x.xml");
}

TEST_CASE("ResolveUrl: relative reference replaces last segment", "[core][url]") {
    CHECK(ResolveUrl("http://cs/conf/internalconf?v=1", "part.xml") ==
          "http://cs/conf/part.xml");
    CHECK(ResolveUrl("http://cs", "part.xml") == "http://cs/part.xml");
}
