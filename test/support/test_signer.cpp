#include "test_signer.hpp"

#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <stdexcept>

namespace xrdinfo::testing {

namespace {

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

void Check(bool ok, const char* what) {
    if (!ok) {
        throw std::runtime_error(std::string("TestSigner: ") + what + " failed");
    }
}

EVP_PKEY* GenerateKey(TestSigner::KeyType type) {
    const int id = type == TestSigner::KeyType::Rsa ? EVP_PKEY_RSA : EVP_PKEY_EC;
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(id, nullptr));
    Check(ctx != nullptr, "EVP_PKEY_CTX_new_id");
    Check(EVP_PKEY_keygen_init(ctx.get()) == 1, "EVP_PKEY_keygen_init");
    if (type == TestSigner::KeyType::Rsa) {
        Check(EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) > 0, "set_rsa_keygen_bits");
    } else {
        Check(EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) > 0,
              "set_ec_paramgen_curve_nid");
    }
    EVP_PKEY* key = nullptr;
    Check(EVP_PKEY_keygen(ctx.get(), &key) == 1, "EVP_PKEY_keygen");
    return key;
}

std::string SelfSignedCertificate(EVP_PKEY* key) {
    std::unique_ptr<X509, X509Deleter> cert(X509_new());
    Check(cert != nullptr, "X509_new");
    Check(X509_set_version(cert.get(), 2) == 1, "X509_set_version");
    Check(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1) == 1, "serial");
    Check(X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) != nullptr, "notBefore");
    Check(X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24) != nullptr,
          "notAfter");
    Check(X509_set_pubkey(cert.get(), key) == 1, "X509_set_pubkey");

    X509_NAME* name = X509_get_subject_name(cert.get());
    Check(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                     reinterpret_cast<const unsigned char*>("xrdinfo test"),
                                     -1, -1, 0) == 1,
          "X509_NAME_add_entry_by_txt");
    Check(X509_set_issuer_name(cert.get(), name) == 1, "X509_set_issuer_name");
    Check(X509_sign(cert.get(), key, EVP_sha256()) > 0, "X509_sign");

    const int length = i2d_X509(cert.get(), nullptr);
    Check(length > 0, "i2d_X509");
    std::string der(static_cast<size_t>(length), '\0');
    auto* cursor = reinterpret_cast<unsigned char*>(der.data());
    Check(i2d_X509(cert.get(), &cursor) == length, "i2d_X509");
    return der;
}

std::string DigestBase64(const std::string& algorithm, std::string_view data) {
    auto digest = ComputeDigest(algorithm, data);
    if (digest.IsErr()) {
        throw std::runtime_error("TestSigner: " + digest.Error().message);
    }
    return Base64Encode(digest.Value());
}

} // anonymous namespace

TestSigner::TestSigner(KeyType type)
    : type_(type), key_(GenerateKey(type)) {
    try {
        cert_der_ = SelfSignedCertificate(key_);
    } catch (const std::runtime_error&) {
        EVP_PKEY_free(key_);
        throw;
    }
}

TestSigner::~TestSigner() {
    EVP_PKEY_free(key_);
}

std::string TestSigner::SignatureAlgorithm() const {
    return type_ == KeyType::Rsa ? algorithm_uri::kRsaSha512 : algorithm_uri::kEcdsaSha512;
}

std::string TestSigner::Sign(std::string_view data) const {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    Check(ctx != nullptr, "EVP_MD_CTX_new");
    Check(EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha512(), nullptr, key_) == 1,
          "EVP_DigestSignInit");
    Check(EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) == 1,
          "EVP_DigestSignUpdate");
    size_t length = 0;
    Check(EVP_DigestSignFinal(ctx.get(), nullptr, &length) == 1, "EVP_DigestSignFinal");
    std::string signature(length, '\0');
    Check(EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()),
                              &length) == 1,
          "EVP_DigestSignFinal");
    signature.resize(length);
    return signature;
}

ConfigurationAnchor TestSigner::Anchor(const std::string& instance,
                                       const std::vector<std::string>& urls) const {
    std::vector<AnchorSource> sources;
    for (const auto& url : urls) {
        sources.push_back(AnchorSource{url, {cert_der_}});
    }
    return ConfigurationAnchor(instance, std::move(sources));
}

std::string TestSigner::AnchorXml(const std::string& instance,
                                  const std::vector<std::string>& urls) const {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                      "<configurationAnchor>\n"
                      "  <generatedAt>2024-05-01T10:00:00Z</generatedAt>\n"
                      "  <instanceIdentifier>" + instance + "</instanceIdentifier>\n";
    for (const auto& url : urls) {
        xml += "  <source>\n"
               "    <downloadURL>" + url + "</downloadURL>\n"
               "    <verificationCert>" + Base64Encode(cert_der_) + "</verificationCert>\n"
               "  </source>\n";
    }
    xml += "</configurationAnchor>\n";
    return xml;
}

SignedBundle BuildSignedBundle(const TestSigner& signer,
                               const std::vector<BundlePart>& parts,
                               const BundleOptions& options) {
    const std::string outer = "outerBoundary1234";
    const std::string inner = "innerBoundary5678";

    // Directory part, exactly as it sits between the outer delimiters.
    std::string listing = "Content-Type: multipart/mixed; boundary=" + inner + "\r\n";
    if (options.expire_date.has_value()) {
        listing += "Expire-date: " + *options.expire_date + "\r\n";
    }
    listing += "Version: " + options.version + "\r\n\r\n";
    for (const auto& part : parts) {
        listing += "--" + inner + "\r\n";
        listing += "Content-Type: application/octet-stream\r\n";
        listing += "Content-Transfer-Encoding: base64\r\n";
        listing += "Content-Identifier: " + part.content_identifier + "; instance=\"" +
                   part.instance + "\"\r\n";
        listing += "Content-location: " + part.location + "\r\n";
        listing += "Hash-algorithm-id: " + options.digest_algorithm + "\r\n";
        if (part.expire_date.has_value()) {
            listing += "Expire-date: " + *part.expire_date + "\r\n";
        }
        if (part.version.has_value()) {
            listing += "Version: " + *part.version + "\r\n";
        }
        listing += "\r\n" + DigestBase64(options.digest_algorithm, part.content) + "\r\n";
    }
    listing += "--" + inner + "--";

    std::string signature = signer.Sign(listing);
    if (options.corrupt_signature) {
        signature[signature.size() / 2] ^= 0x01;
    }

    std::string signature_part = "Content-Type: application/octet-stream\r\n"
                                 "Content-Transfer-Encoding: base64\r\n"
                                 "Signature-algorithm-id: " + signer.SignatureAlgorithm() +
                                 "\r\n";
    if (options.include_cert_hash) {
        signature_part += "Verification-certificate-hash: " +
                          DigestBase64(algorithm_uri::kSha512, signer.CertificateDer()) +
                          "; hash-algorithm-id=\"" + algorithm_uri::kSha512 + "\"\r\n";
    }
    signature_part += "\r\n" + Base64Encode(signature);

    SignedBundle bundle;
    bundle.content_type = "multipart/related; charset=UTF-8; boundary=" + outer;
    bundle.body = "--" + outer + "\r\n" + listing + "\r\n--" + outer + "\r\n" +
                  signature_part + "\r\n--" + outer + "--\r\n";
    bundle.signed_data = std::move(listing);
    return bundle;
}

} // namespace xrdinfo::testing
