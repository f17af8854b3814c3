#include <xrdinfo/conf/configuration_anchor.hpp>
#include <xrdinfo/conf/crypto.hpp>
#include "../xml/xml_utils.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace xrdinfo {

namespace {

Error AnchorError(const std::string& message) {
    return Error{"ParseAnchor", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Format};
}

std::string Trimmed(std::string value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // anonymous namespace

ConfigurationAnchor::ConfigurationAnchor(std::string instance_identifier,
                                         std::vector<AnchorSource> sources)
    : instance_identifier_(std::move(instance_identifier)),
      sources_(std::move(sources)) {}

ConfigurationAnchor ConfigurationAnchor::FromUrls(std::string instance_identifier,
                                                  const std::vector<std::string>& urls) {
    std::vector<AnchorSource> sources;
    sources.reserve(urls.size());
    for (const auto& url : urls) {
        sources.push_back({url, {}});
    }
    return ConfigurationAnchor(std::move(instance_identifier), std::move(sources));
}

Result<ConfigurationAnchor, Error> ConfigurationAnchor::Parse(std::string_view xml) {
    tinyxml2::XMLDocument doc;
    if (auto parse_error = xml_utils::ParseXmlOrError(
            doc, xml, "ParseAnchor", "", "Failed to parse configuration anchor XML")) {
        return Result<ConfigurationAnchor, Error>::Err(std::move(*parse_error));
    }

    const auto* root = doc.RootElement();
    if (!xml_utils::HasLocalName(root, "configurationAnchor")) {
        return Result<ConfigurationAnchor, Error>::Err(
            AnchorError("Root element is not configurationAnchor"));
    }

    auto instance = Trimmed(xml_utils::ChildTextOr(root, "instanceIdentifier"));
    if (instance.empty()) {
        return Result<ConfigurationAnchor, Error>::Err(
            AnchorError("Anchor has no instanceIdentifier"));
    }

    std::vector<AnchorSource> sources;
    for (const auto* source : xml_utils::ChildrenByLocalName(root, "source")) {
        AnchorSource entry;
        entry.download_url = Trimmed(xml_utils::ChildTextOr(source, "downloadURL"));
        if (entry.download_url.empty()) {
            return Result<ConfigurationAnchor, Error>::Err(
                AnchorError("Anchor source has no downloadURL"));
        }
        for (const auto* cert : xml_utils::ChildrenByLocalName(source, "verificationCert")) {
            const char* text = cert->GetText();
            auto der = Base64Decode(text != nullptr ? text : "");
            if (!der.has_value() || der->empty()) {
                return Result<ConfigurationAnchor, Error>::Err(AnchorError(
                    "Invalid verificationCert for source " + entry.download_url));
            }
            entry.verification_certs.push_back(std::move(*der));
        }
        sources.push_back(std::move(entry));
    }

    if (sources.empty()) {
        return Result<ConfigurationAnchor, Error>::Err(
            AnchorError("Anchor lists no configuration source"));
    }

    return Result<ConfigurationAnchor, Error>::Ok(
        ConfigurationAnchor(std::move(instance), std::move(sources)));
}

Result<ConfigurationAnchor, Error> ConfigurationAnchor::LoadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<ConfigurationAnchor, Error>::Err(Error{
            "LoadAnchor", path, std::nullopt, "Cannot open anchor file", std::nullopt,
            ErrorCategory::InvalidArgument});
    }
    std::ostringstream content;
    content << in.rdbuf();
    auto anchor = Parse(content.str());
    if (anchor.IsErr()) {
        auto error = anchor.Error();
        error.endpoint = path;
        return Result<ConfigurationAnchor, Error>::Err(std::move(error));
    }
    return anchor;
}

std::vector<std::string> ConfigurationAnchor::SourceUrls() const {
    std::vector<std::string> urls;
    urls.reserve(sources_.size());
    for (const auto& source : sources_) {
        urls.push_back(source.download_url);
    }
    return urls;
}

std::vector<std::string> ConfigurationAnchor::VerificationCerts() const {
    std::vector<std::string> certs;
    for (const auto& source : sources_) {
        for (const auto& cert : source.verification_certs) {
            if (std::find(certs.begin(), certs.end(), cert) == certs.end()) {
                certs.push_back(cert);
            }
        }
    }
    return certs;
}

} // namespace xrdinfo
