#pragma once

#include <chrono>
#include <core/model/ext_key_usage.h>
#include <core/model/root_of_trust.h>
#include <core/security/certificate_manager.h>
#include <core/security/certificate_signer.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/base64.h>
#include <core/util/binary_data.h>
#include <memory>
#include <stdexcept>
#include <string>

// In-memory PKI for tests: a CA, leaf certificates issued by it, and CSRs.
namespace edgegate::core::pki {

// P-256 keeps key generation fast.
inline EvpPkeyPtr GenerateKey() {
    EVP_PKEY* key = EVP_EC_gen("P-256");
    if (!key) {
        throw std::runtime_error("EC key generation failed: " + OpenSSLProvider::LastError());
    }
    return EvpPkeyPtr(key);
}

struct TestCa {
    EvpPkeyPtr key;
    X509Ptr certificate;
    std::string certificate_pem;
    std::string key_pem;
    std::unique_ptr<RootOfTrust> root;
};

inline TestCa MakeCa(const std::string& common_name = "test-ca") {
    TestCa ca;
    ca.key = GenerateKey();
    ca.certificate = CertificateManager::GenerateCaCertificate(ca.key.get(), common_name);
    ca.certificate_pem = OpenSSLProvider::CertificateToPem(ca.certificate.get());
    ca.key_pem = OpenSSLProvider::PrivateKeyToPem(ca.key.get());
    ca.root = std::make_unique<RootOfTrust>(ca.certificate_pem, ca.key_pem);
    return ca;
}

// PEM CSR with a fresh key. An empty organization leaves O out of the subject.
inline std::string MakeCsr(const std::string& organization, const std::string& common_name) {
    EvpPkeyPtr key = GenerateKey();
    return CertificateManager::CreateCsr(key.get(), organization, common_name);
}

// Leaf certificate together with the key its CSR was made from.
struct TestIdentity {
    EvpPkeyPtr key;
    X509Ptr certificate;
};

inline TestIdentity IssueIdentity(const TestCa& ca,
                                  const std::string& organization,
                                  const std::string& common_name,
                                  const ExtKeyUsages& usages = {ExtKeyUsage::kClientAuth},
                                  std::chrono::seconds validity = std::chrono::hours(1)) {
    TestIdentity identity;
    identity.key = GenerateKey();
    X509CsrSigner signer;
    BinaryData der = signer.Sign(
        ToBinary(CertificateManager::CreateCsr(identity.key.get(), organization, common_name)),
        ca.certificate.get(),
        ca.key.get(),
        usages,
        validity);
    identity.certificate = OpenSSLProvider::ParseCertificateDer(der);
    return identity;
}

inline X509Ptr IssueLeaf(const TestCa& ca,
                         const std::string& organization,
                         const std::string& common_name,
                         const ExtKeyUsages& usages = {ExtKeyUsage::kClientAuth},
                         std::chrono::seconds validity = std::chrono::hours(1)) {
    return IssueIdentity(ca, organization, common_name, usages, validity).certificate;
}

inline X509Ptr IssueNodeCertificate(const TestCa& ca, const std::string& node_name) {
    return IssueLeaf(ca, "system:nodes", "system:node:" + node_name);
}

// Value a TLS-terminating proxy puts in X-Forwarded-Client-Cert.
inline std::string ForwardedHeaderFor(X509* cert) {
    return base64::Encode(ToBinary(OpenSSLProvider::CertificateToPem(cert)));
}

inline bool SameCertificate(X509* a, X509* b) {
    return X509_cmp(a, b) == 0;
}

} // namespace edgegate::core::pki
