#include <xrdinfo/conf/trust_verifier.hpp>
#include <xrdinfo/conf/crypto.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <chrono>

namespace xrdinfo {

namespace {

constexpr const char* kComponent = "trust";

struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

enum class KeyKind { Rsa, Ec };

struct SignatureScheme {
    const EVP_MD* md = nullptr;
    KeyKind key = KeyKind::Rsa;
};

std::optional<SignatureScheme> SchemeForUri(std::string_view uri) {
    using namespace algorithm_uri;
    if (uri == kRsaSha256) return SignatureScheme{EVP_sha256(), KeyKind::Rsa};
    if (uri == kRsaSha384) return SignatureScheme{EVP_sha384(), KeyKind::Rsa};
    if (uri == kRsaSha512) return SignatureScheme{EVP_sha512(), KeyKind::Rsa};
    if (uri == kRsaSha1) return SignatureScheme{EVP_sha1(), KeyKind::Rsa};
    if (uri == kEcdsaSha256) return SignatureScheme{EVP_sha256(), KeyKind::Ec};
    if (uri == kEcdsaSha384) return SignatureScheme{EVP_sha384(), KeyKind::Ec};
    if (uri == kEcdsaSha512) return SignatureScheme{EVP_sha512(), KeyKind::Ec};
    return std::nullopt;
}

Error TrustError(const std::string& message, const std::string& endpoint = "") {
    return Error{"VerifyConfiguration", endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Trust};
}

// Verify signature over data with the public key of a DER certificate.
bool VerifyWithCertificate(const std::string& der,
                           const SignatureScheme& scheme,
                           const std::string& data,
                           const std::string& signature) {
    const auto* cursor = reinterpret_cast<const unsigned char*>(der.data());
    std::unique_ptr<X509, X509Deleter> cert(
        d2i_X509(nullptr, &cursor, static_cast<long>(der.size())));
    if (!cert) {
        ERR_clear_error();
        return false;
    }
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(X509_get_pubkey(cert.get()));
    if (!key) {
        ERR_clear_error();
        return false;
    }
    const int key_type = EVP_PKEY_base_id(key.get());
    if ((scheme.key == KeyKind::Rsa && key_type != EVP_PKEY_RSA) ||
        (scheme.key == KeyKind::Ec && key_type != EVP_PKEY_EC)) {
        return false;
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    const bool ok =
        ctx &&
        EVP_DigestVerifyInit(ctx.get(), nullptr, scheme.md, nullptr, key.get()) == 1 &&
        EVP_DigestVerifyUpdate(ctx.get(), data.data(), data.size()) == 1 &&
        EVP_DigestVerifyFinal(ctx.get(),
                              reinterpret_cast<const unsigned char*>(signature.data()),
                              signature.size()) == 1;
    ERR_clear_error();
    return ok;
}

} // anonymous namespace

TrustVerifier::TrustVerifier(const ConfigurationAnchor& anchor, TrustVerifierOptions options)
    : anchor_(anchor),
      clock_(std::move(options.clock)),
      logger_(OrSilent(std::move(options.logger))) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

Result<void, Error> TrustVerifier::VerifySignature(
    const ConfigurationDirectory& directory) const {
    auto scheme = SchemeForUri(directory.signature_algorithm);
    if (!scheme.has_value()) {
        return Result<void, Error>::Err(TrustError(
            "Unsupported signature algorithm '" + directory.signature_algorithm + "'"));
    }
    auto signature = Base64Decode(directory.signature);
    if (!signature.has_value() || signature->empty()) {
        return Result<void, Error>::Err(TrustError("Signature is not valid base64"));
    }

    auto certs = anchor_.VerificationCerts();
    if (certs.empty()) {
        return Result<void, Error>::Err(TrustError(
            "Anchor for instance " + anchor_.InstanceIdentifier() +
            " holds no verification certificate"));
    }

    // Narrow to the certificate the directory names, if it names one.
    if (!directory.verification_cert_hash.empty() &&
        !directory.verification_cert_hash_algorithm.empty()) {
        auto expected = Base64Decode(directory.verification_cert_hash);
        if (!expected.has_value()) {
            return Result<void, Error>::Err(
                TrustError("Verification-certificate-hash is not valid base64"));
        }
        std::vector<std::string> matching;
        for (const auto& cert : certs) {
            auto hash = ComputeDigest(directory.verification_cert_hash_algorithm, cert);
            if (hash.IsErr()) {
                return Result<void, Error>::Err(TrustError(hash.Error().message));
            }
            if (hash.Value() == *expected) {
                matching.push_back(cert);
            }
        }
        if (matching.empty()) {
            return Result<void, Error>::Err(TrustError(
                "Directory is signed by a certificate the anchor does not trust"));
        }
        certs = std::move(matching);
    }

    for (const auto& cert : certs) {
        if (VerifyWithCertificate(cert, *scheme, directory.signed_data, *signature)) {
            logger_->Debug(kComponent, "Directory signature verified");
            return Result<void, Error>::Ok();
        }
    }
    return Result<void, Error>::Err(TrustError("Directory signature verification failed"));
}

Result<std::vector<VerifiedPart>, Error> TrustVerifier::Verify(
    const ConfigurationDirectory& directory,
    std::vector<ConfigurationPart> parts) const {
    auto signature = VerifySignature(directory);
    if (signature.IsErr()) {
        return Result<std::vector<VerifiedPart>, Error>::Err(signature.Error());
    }

    const auto now = clock_();
    std::vector<VerifiedPart> verified;
    verified.reserve(parts.size());
    for (auto& part : parts) {
        if (part.instance != anchor_.InstanceIdentifier()) {
            return Result<std::vector<VerifiedPart>, Error>::Err(TrustError(
                "Part " + part.content_identifier + " belongs to unknown instance '" +
                    part.instance + "'",
                part.location));
        }

        auto expected = Base64Decode(part.digest_value);
        if (!expected.has_value()) {
            return Result<std::vector<VerifiedPart>, Error>::Err(Error{
                "VerifyConfiguration", part.location, std::nullopt,
                "Digest of " + part.content_identifier + " is not valid base64",
                std::nullopt, ErrorCategory::Integrity});
        }
        auto actual = ComputeDigest(part.digest_algorithm, part.raw_bytes);
        if (actual.IsErr()) {
            auto error = actual.Error();
            error.operation = "VerifyConfiguration";
            error.endpoint = part.location;
            return Result<std::vector<VerifiedPart>, Error>::Err(std::move(error));
        }
        if (actual.Value() != *expected) {
            return Result<std::vector<VerifiedPart>, Error>::Err(Error{
                "VerifyConfiguration", part.location, std::nullopt,
                "Digest mismatch for " + part.content_identifier,
                std::nullopt, ErrorCategory::Integrity});
        }

        const bool stale = part.expiration.has_value() && *part.expiration < now;
        if (stale) {
            logger_->Warn(kComponent, part.content_identifier + " expired at " +
                                          FormatIso8601(*part.expiration));
        }
        verified.push_back(VerifiedPart(std::move(part), stale));
    }
    return Result<std::vector<VerifiedPart>, Error>::Ok(std::move(verified));
}

} // namespace xrdinfo
