#include <core/model/enrollment_error.h>
#include <core/security/certificate_signer.h>
#include <ctime>
#include <openssl/bn.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace edgegate::core {

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

struct ExtensionsDeleter {
    void operator()(STACK_OF(X509_EXTENSION) * exts) const {
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    }
};

constexpr int kSerialBits = 128;

X509ReqPtr parseCsr(const BinaryData& csr) {
    std::string_view text = AsStringView(csr);
    X509ReqPtr req;
    if (text.find("-----BEGIN") != std::string_view::npos) {
        BioPtr bio(BIO_new_mem_buf(csr.data(), static_cast<int>(csr.size())));
        req.reset(PEM_read_bio_X509_REQ(bio.get(), nullptr, nullptr, nullptr));
    } else {
        const unsigned char* cursor = csr.data();
        req.reset(d2i_X509_REQ(nullptr, &cursor, static_cast<long>(csr.size())));
        if (req && cursor != csr.data() + csr.size()) {
            throw std::runtime_error("trailing data after certificate request");
        }
    }
    if (!req) {
        throw std::runtime_error("failed to parse certificate request: "
                                 + OpenSSLProvider::LastError());
    }

    EvpPkeyPtr key(X509_REQ_get_pubkey(req.get()));
    if (!key || X509_REQ_verify(req.get(), key.get()) != 1) {
        throw std::runtime_error("certificate request signature verification failed");
    }
    return req;
}

void setRandomSerial(X509* cert) {
    std::unique_ptr<BIGNUM, BnDeleter> bn(BN_new());
    if (!bn || BN_rand(bn.get(), kSerialBits, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1) {
        throw std::runtime_error("failed to generate serial number");
    }
    ASN1_INTEGER* serial = X509_get_serialNumber(cert);
    if (!BN_to_ASN1_INTEGER(bn.get(), serial)) {
        throw std::runtime_error("failed to set serial number");
    }
}

void addExtension(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) {
        throw std::runtime_error(
            fmt::format("failed to build extension {}: {}", OBJ_nid2sn(nid), value));
    }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (ok != 1) {
        throw std::runtime_error(fmt::format("failed to add extension {}", OBJ_nid2sn(nid)));
    }
}

void copySubjectAltName(X509_REQ* req, X509* cert) {
    std::unique_ptr<STACK_OF(X509_EXTENSION), ExtensionsDeleter> exts(X509_REQ_get_extensions(req));
    if (!exts) {
        return;
    }
    for (int i = 0; i < sk_X509_EXTENSION_num(exts.get()); ++i) {
        X509_EXTENSION* ext = sk_X509_EXTENSION_value(exts.get(), i);
        if (OBJ_obj2nid(X509_EXTENSION_get_object(ext)) == NID_subject_alt_name) {
            if (X509_add_ext(cert, ext, -1) != 1) {
                throw std::runtime_error("failed to copy subjectAltName from request");
            }
            return;
        }
    }
}

std::string joinUsages(const ExtKeyUsages& usages) {
    std::string joined;
    for (auto usage : usages) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += ExtKeyUsageToOpenSSL(usage);
    }
    return joined;
}

const EVP_MD* digestFor(EVP_PKEY* key) {
    // Ed25519 and Ed448 sign the message directly.
    int id = EVP_PKEY_id(key);
    if (id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448) {
        return nullptr;
    }
    return EVP_sha256();
}

} // namespace

BinaryData X509CsrSigner::Sign(const BinaryData& csr,
                               X509* ca_cert,
                               EVP_PKEY* ca_key,
                               const ExtKeyUsages& usages,
                               std::chrono::seconds validity) const {
    if (csr.empty()) {
        throw std::runtime_error("certificate request is empty");
    }
    X509ReqPtr req = parseCsr(csr);

    X509Ptr cert = OpenSSLProvider::Adopt(X509_new());
    if (!cert || X509_set_version(cert.get(), 2) != 1) {
        throw std::runtime_error("failed to allocate certificate");
    }
    setRandomSerial(cert.get());

    if (X509_set_issuer_name(cert.get(), X509_get_subject_name(ca_cert)) != 1
        || X509_set_subject_name(cert.get(), X509_REQ_get_subject_name(req.get())) != 1) {
        throw std::runtime_error("failed to set certificate names");
    }

    EvpPkeyPtr subject_key(X509_REQ_get_pubkey(req.get()));
    if (!subject_key || X509_set_pubkey(cert.get(), subject_key.get()) != 1) {
        throw std::runtime_error("failed to set certificate public key");
    }

    std::time_t now = std::time(nullptr);
    if (!X509_time_adj_ex(X509_getm_notBefore(cert.get()), 0, 0, &now)
        || !X509_time_adj_ex(X509_getm_notAfter(cert.get()),
                             0,
                             static_cast<long>(validity.count()),
                             &now)) {
        throw std::runtime_error("failed to set certificate validity");
    }

    addExtension(cert.get(), ca_cert, NID_basic_constraints, "critical,CA:FALSE");
    addExtension(cert.get(), ca_cert, NID_key_usage, "critical,digitalSignature,keyEncipherment");
    if (!usages.empty()) {
        addExtension(cert.get(), ca_cert, NID_ext_key_usage, joinUsages(usages));
    }
    addExtension(cert.get(), ca_cert, NID_authority_key_identifier, "keyid,issuer");
    copySubjectAltName(req.get(), cert.get());

    if (X509_sign(cert.get(), ca_key, digestFor(ca_key)) <= 0) {
        throw std::runtime_error("failed to sign certificate: " + OpenSSLProvider::LastError());
    }
    return OpenSSLProvider::CertificateToDer(cert.get());
}

CertificateSigner::CertificateSigner(const RootOfTrust& root,
                                     const EnrollmentSettings& settings,
                                     std::unique_ptr<CsrSigner> signer)
    : root_(root)
    , validity_(std::chrono::hours(24) * settings.edge_cert_signing_duration_days)
    , signer_(std::move(signer)) {}

std::string CertificateSigner::Sign(const BinaryData& csr, std::string_view usages_header) const {
    spdlog::debug("Received sign certificate request, ExtKeyUsages: {}", usages_header);
    ExtKeyUsages usages;
    try {
        usages = ParseExtKeyUsages(usages_header);
    } catch (const std::invalid_argument& e) {
        throw SignError(fmt::format("unmarshal http header ExtKeyUsages fail, err: {}", e.what()));
    }
    return Sign(csr, usages);
}

std::string CertificateSigner::Sign(const BinaryData& csr, const ExtKeyUsages& usages) const {
    try {
        BinaryData der = signer_->Sign(csr,
                                       root_.certificate(),
                                       root_.private_key(),
                                       usages,
                                       std::chrono::duration_cast<std::chrono::seconds>(validity_));
        X509Ptr cert = OpenSSLProvider::ParseCertificateDer(der);
        return OpenSSLProvider::CertificateToPem(cert.get());
    } catch (const SignError&) {
        throw;
    } catch (const std::exception& e) {
        throw SignError(fmt::format("fail to signCerts, err: {}", e.what()));
    }
}

} // namespace edgegate::core
