#include <xrdinfo/conf/crypto.hpp>

#include <openssl/evp.h>

#include <cctype>
#include <vector>

namespace xrdinfo {

namespace {

const EVP_MD* DigestForUri(std::string_view uri) {
    if (uri == algorithm_uri::kSha256) return EVP_sha256();
    if (uri == algorithm_uri::kSha384) return EVP_sha384();
    if (uri == algorithm_uri::kSha512) return EVP_sha512();
    if (uri == algorithm_uri::kSha1) return EVP_sha1();
    return nullptr;
}

} // anonymous namespace

std::optional<std::string> Base64Decode(std::string_view encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact += c;
        }
    }
    if (compact.empty()) {
        return std::string();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(compact.size() / 4 * 3);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(compact.data()),
                                        static_cast<int>(compact.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    size_t length = static_cast<size_t>(written);
    if (compact.back() == '=') --length;
    if (compact.size() >= 2 && compact[compact.size() - 2] == '=') --length;
    return std::string(reinterpret_cast<const char*>(out.data()), length);
}

std::string Base64Encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::vector<unsigned char> out((data.size() + 2) / 3 * 4 + 1);
    const int written = EVP_EncodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written));
}

Result<std::string, Error> ComputeDigest(std::string_view algorithm_uri,
                                         std::string_view data) {
    const EVP_MD* md = DigestForUri(algorithm_uri);
    if (md == nullptr) {
        return Result<std::string, Error>::Err(Error{
            "ComputeDigest", "", std::nullopt,
            "Unsupported digest algorithm '" + std::string(algorithm_uri) + "'",
            std::nullopt, ErrorCategory::Integrity});
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, md, nullptr) != 1) {
        return Result<std::string, Error>::Err(Error{
            "ComputeDigest", "", std::nullopt, "Digest computation failed",
            std::nullopt, ErrorCategory::Internal});
    }
    return Result<std::string, Error>::Ok(
        std::string(reinterpret_cast<const char*>(digest), digest_len));
}

} // namespace xrdinfo
