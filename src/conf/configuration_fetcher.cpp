#include <xrdinfo/conf/configuration_fetcher.hpp>
#include <xrdinfo/conf/directory_parser.hpp>
#include <xrdinfo/core/url.hpp>

namespace xrdinfo {

namespace {

constexpr const char* kComponent = "fetch";

// Outcome of one source attempt: a bundle, a failure that lets the next
// source be tried, or a failure that ends the fetch.
struct Attempt {
    std::optional<FetchedBundle> bundle;
    std::optional<Error> error;
    bool fatal = false;
};

Result<HttpResponse, Error> GetOk(IHttpTransport& transport,
                                  const std::string& url,
                                  std::chrono::milliseconds timeout) {
    auto response = transport.Get(url, {}, timeout);
    if (response.IsErr()) {
        return response;
    }
    if (!response.Value().IsSuccess()) {
        return Result<HttpResponse, Error>::Err(Error::FromHttpStatus(
            "Fetch", url, response.Value().status_code, response.Value().body));
    }
    return response;
}

} // anonymous namespace

ConfigurationFetcher::ConfigurationFetcher(IHttpTransport& transport, FetchOptions options)
    : transport_(transport),
      options_(std::move(options)),
      logger_(OrSilent(options_.logger)) {}

Result<FetchedBundle, Error> ConfigurationFetcher::Fetch(
    const ConfigurationAnchor& anchor) const {
    return Fetch(anchor.SourceUrls());
}

Result<FetchedBundle, Error> ConfigurationFetcher::Fetch(
    const std::vector<std::string>& source_urls) const {
    if (source_urls.empty()) {
        return Result<FetchedBundle, Error>::Err(Error{
            "Fetch", "", std::nullopt, "No configuration source given", std::nullopt,
            ErrorCategory::InvalidArgument});
    }

    auto try_source = [&](const std::string& url) -> Attempt {
        logger_->Debug(kComponent, "Trying configuration source " + url);

        auto directory_response = GetOk(transport_, url, options_.timeout);
        if (directory_response.IsErr()) {
            return Attempt{std::nullopt, directory_response.Error(), false};
        }

        FetchedBundle bundle;
        bundle.source_url = url;
        bundle.content_type =
            FindHeader(directory_response.Value().headers, "Content-Type").value_or("");
        bundle.directory_body = directory_response.Value().body;

        auto directory = ParseDirectory(bundle.content_type, bundle.directory_body);
        if (directory.IsErr()) {
            auto error = directory.Error();
            error.endpoint = url;
            return Attempt{std::nullopt, std::move(error), true};
        }

        for (const auto& entry : directory.Value().entries) {
            if (bundle.contents.count(entry.location) != 0) {
                continue;
            }
            const auto content_url = ResolveUrl(url, entry.location);
            logger_->Debug(kComponent, "Fetching " + entry.content_identifier + " from " +
                                           content_url);
            auto content = GetOk(transport_, content_url, options_.timeout);
            if (content.IsErr()) {
                return Attempt{std::nullopt, content.Error(), false};
            }
            bundle.contents.emplace(entry.location, content.Value().body);
        }
        return Attempt{std::move(bundle), std::nullopt, false};
    };

    std::optional<Error> last_error;
    for (const auto& source : source_urls) {
        const auto url = WithDefaultPath(AddUrlScheme(source, false), "internalconf");
        auto attempt = try_source(url);
        if (attempt.bundle.has_value()) {
            logger_->Info(kComponent, "Configuration fetched from " + url);
            return Result<FetchedBundle, Error>::Ok(std::move(*attempt.bundle));
        }
        if (attempt.fatal) {
            return Result<FetchedBundle, Error>::Err(std::move(*attempt.error));
        }
        logger_->Warn(kComponent, "Configuration source failed: " + attempt.error->ToString());
        last_error = std::move(attempt.error);
    }

    const auto& last = *last_error;
    Error error{"Fetch",
                last.endpoint,
                last.http_status,
                "All " + std::to_string(source_urls.size()) +
                    " configuration source(s) failed; last: " + last.message,
                last.remote_error,
                last.category == ErrorCategory::Timeout ? ErrorCategory::Timeout
                                                        : ErrorCategory::Network};
    return Result<FetchedBundle, Error>::Err(std::move(error));
}

} // namespace xrdinfo
