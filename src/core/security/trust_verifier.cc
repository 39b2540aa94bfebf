#include <core/model/enrollment_error.h>
#include <core/security/trust_verifier.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace edgegate::core {

namespace {

std::optional<std::string> entryText(X509_NAME* name, int index) {
    X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, index);
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
    unsigned char* utf8 = nullptr;
    int length = ASN1_STRING_to_UTF8(&utf8, data);
    if (length < 0) {
        return std::nullopt;
    }
    std::string text(reinterpret_cast<char*>(utf8), static_cast<std::size_t>(length));
    OPENSSL_free(utf8);
    return text;
}

} // namespace

TrustVerifier::TrustVerifier(const RootOfTrust& root, bool allow_legacy_subject)
    : root_(root)
    , allow_legacy_subject_(allow_legacy_subject) {}

void TrustVerifier::Verify(X509* cert, std::string_view node_name) const {
    verifyChain(cert);
    VerifySubject(cert, node_name);
}

void TrustVerifier::verifyChain(X509* cert) const {
    X509StorePtr store(X509_STORE_new());
    if (!store || X509_STORE_add_cert(store.get(), root_.certificate()) != 1) {
        throw AuthError("failed to parse root certificate");
    }

    X509StoreCtxPtr ctx(X509_STORE_CTX_new());
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store.get(), cert, nullptr) != 1) {
        throw AuthError("failed to initialize certificate verification: "
                        + OpenSSLProvider::LastError());
    }
    X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_CLIENT);

    if (X509_verify_cert(ctx.get()) != 1) {
        int err = X509_STORE_CTX_get_error(ctx.get());
        ERR_clear_error();
        throw AuthError(fmt::format("failed to verify edge certificate: {}",
                                    X509_verify_cert_error_string(err)));
    }
}

void TrustVerifier::VerifySubject(X509* cert, std::string_view node_name) const {
    CertificateSubject subject = ReadSubject(cert);

    if (subject.organization) {
        if (allow_legacy_subject_ && *subject.organization == subject::kLegacyOrganization
            && subject.common_name == subject::kLegacyCommonName) {
            // TODO: drop once no edge node presents pre-node-scoped certificates,
            // together with policy.allow-legacy-subject.
            spdlog::warn("Accepted legacy certificate subject O={} CN={} for node {}",
                         *subject.organization,
                         subject.common_name,
                         node_name);
            return;
        }

        std::string expected = fmt::format("{}{}", subject::kNodeCommonNamePrefix, node_name);
        if (*subject.organization == subject::kNodesOrganization
            && subject.common_name == expected) {
            return;
        }
    }
    throw AuthError("request node name is not match with the certificate");
}

CertificateSubject TrustVerifier::ReadSubject(X509* cert) {
    CertificateSubject subject;
    X509_NAME* name = X509_get_subject_name(cert);
    if (!name) {
        return subject;
    }

    int org_index = X509_NAME_get_index_by_NID(name, NID_organizationName, -1);
    if (org_index >= 0) {
        subject.organization = entryText(name, org_index);
    }

    int cn_index = -1;
    while ((cn_index = X509_NAME_get_index_by_NID(name, NID_commonName, cn_index)) >= 0) {
        if (auto text = entryText(name, cn_index)) {
            subject.common_name = std::move(*text);
        }
    }
    return subject;
}

} // namespace edgegate::core
