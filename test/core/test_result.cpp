#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace xrdinfo;

namespace {

Error MakeError(ErrorCategory category, std::string message = "failed") {
    return Error{"Op", "/endpoint", std::nullopt, std::move(message),
                 std::nullopt, category};
}

Result<int, Error> ParsePort(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Result<int, Error>::Err(
            MakeError(ErrorCategory::InvalidArgument, "not a port: " + text));
    }
    return Result<int, Error>::Ok(std::stoi(text));
}

} // anonymous namespace

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok holds the value", "[result]") {
    auto r = ParsePort("8443");
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 8443);
}

TEST_CASE("Result: Err holds the error", "[result]") {
    auto r = ParsePort("80a");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    CHECK(r.Error().message == "not a port: 80a");
}

TEST_CASE("Result: ValueOr falls back on error", "[result]") {
    CHECK(ParsePort("443").ValueOr(80) == 443);
    CHECK(ParsePort("").ValueOr(80) == 80);
}

TEST_CASE("Result: rvalue Value moves move-only types out", "[result]") {
    auto r = Result<std::unique_ptr<std::string>, Error>::Ok(
        std::make_unique<std::string>("payload"));
    auto owned = std::move(r).Value();
    REQUIRE(owned != nullptr);
    CHECK(*owned == "payload");
}

TEST_CASE("Result: AndThen chains and short-circuits", "[result]") {
    auto doubled = [](int port) {
        return Result<int, Error>::Ok(port * 2);
    };

    auto ok = ParsePort("21").AndThen(doubled);
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 42);

    bool called = false;
    auto err = ParsePort("x").AndThen([&](int port) {
        called = true;
        return Result<int, Error>::Ok(port);
    });
    CHECK(err.IsErr());
    CHECK_FALSE(called);
}

TEST_CASE("Result: Map transforms the value type", "[result]") {
    auto mapped = ParsePort("80").Map([](int port) { return std::to_string(port) + "/tcp"; });
    REQUIRE(mapped.IsOk());
    CHECK(mapped.Value() == "80/tcp");

    auto failed = ParsePort("").Map([](int port) { return port + 1; });
    CHECK(failed.IsErr());
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(MakeError(ErrorCategory::Trust));
    REQUIRE(err.IsErr());
    CHECK(err.Error().category == ErrorCategory::Trust);
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: exit codes per category", "[result][error]") {
    CHECK(MakeError(ErrorCategory::Network).ExitCode() == 1);
    CHECK(MakeError(ErrorCategory::Connection).ExitCode() == 1);
    CHECK(MakeError(ErrorCategory::Timeout).ExitCode() == 2);
    CHECK(MakeError(ErrorCategory::Format).ExitCode() == 3);
    CHECK(MakeError(ErrorCategory::Integrity).ExitCode() == 4);
    CHECK(MakeError(ErrorCategory::Trust).ExitCode() == 5);
    CHECK(MakeError(ErrorCategory::ProtocolFault).ExitCode() == 6);
    CHECK(MakeError(ErrorCategory::AddressResolution).ExitCode() == 7);
    CHECK(MakeError(ErrorCategory::InvalidArgument).ExitCode() == 8);
    CHECK(MakeError(ErrorCategory::Internal).ExitCode() == 99);
}

TEST_CASE("Error: FromHttpStatus keeps SOAP faultstring as remote detail", "[result][error]") {
    const std::string body =
        "<SOAP-ENV:Envelope xmlns:SOAP-ENV=\"http://schemas.xmlsoap.org/soap/envelope/\">"
        "<SOAP-ENV:Body><SOAP-ENV:Fault>"
        "<faultcode>Server.ClientProxy.NetworkError</faultcode>"
        "<faultstring>Connection refused</faultstring>"
        "</SOAP-ENV:Fault></SOAP-ENV:Body></SOAP-ENV:Envelope>";

    auto e = Error::FromHttpStatus("ListMethods", "http://gw/", 500, body);
    CHECK(e.category == ErrorCategory::ProtocolFault);
    CHECK(e.http_status == 500);
    REQUIRE(e.remote_error.has_value());
    CHECK(*e.remote_error == "Connection refused");
}

TEST_CASE("Error: FromHttpStatus reads JSON message", "[result][error]") {
    auto e = Error::FromHttpStatus(
        "GetOpenApi", "http://gw/r1/EE/GOV/1/sub/getOpenAPI", 404,
        R"({"type":"Server.ServerProxy.ServiceFailed","message":"No such service"})");
    CHECK(e.category == ErrorCategory::ProtocolFault);
    REQUIRE(e.remote_error.has_value());
    CHECK(*e.remote_error == "No such service");
}

TEST_CASE("Error: FromHttpStatus maps gateway statuses to Connection", "[result][error]") {
    CHECK(Error::FromHttpStatus("Op", "", 502).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("Op", "", 503).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("Op", "", 408).category == ErrorCategory::Timeout);
    CHECK_FALSE(Error::FromHttpStatus("Op", "", 503).remote_error.has_value());
}

TEST_CASE("Error: Fault exposes the remote code and text", "[result][error]") {
    auto e = Error::Fault("ListMethods", "http://gw/", 200,
                          "Server.ServerProxy.UnknownService", "Unknown service");
    CHECK(e.IsProtocolFault());

    auto fault = e.AsProtocolFault();
    REQUIRE(fault.has_value());
    CHECK(fault->fault_code == "Server.ServerProxy.UnknownService");
    CHECK(fault->fault_string == "Unknown service");

    CHECK_FALSE(MakeError(ErrorCategory::Format).AsProtocolFault().has_value());
}

TEST_CASE("Error: ToString includes endpoint status and remote text", "[result][error]") {
    Error e{"GetWsdl", "http://gw/", 500, "Remote server error",
            std::string("boom"), ErrorCategory::ProtocolFault};
    CHECK(e.ToString() == "GetWsdl [http://gw/] (HTTP 500): Remote server error: boom");
}

TEST_CASE("Error: ToJson carries category and exit code", "[result][error]") {
    auto e = Error::Fault("ListMethods", "http://gw/", std::nullopt,
                          "Client.InvalidRequest", "bad");
    auto j = nlohmann::json::parse(e.ToJson());

    REQUIRE(j.contains("error"));
    const auto& inner = j["error"];
    CHECK(inner["category"] == "protocol_fault");
    CHECK(inner["operation"] == "ListMethods");
    CHECK(inner["fault_code"] == "Client.InvalidRequest");
    CHECK(inner["remote_error"] == "bad");
    CHECK(inner["exit_code"] == 6);
    CHECK_FALSE(inner.contains("http_status"));
}
