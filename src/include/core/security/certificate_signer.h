#pragma once

#include <chrono>
#include <core/model/ext_key_usage.h>
#include <core/model/root_of_trust.h>
#include <core/util/binary_data.h>
#include <core/util/config.h>
#include <memory>
#include <string>
#include <string_view>

namespace edgegate::core {

// Low-level "sign a CSR with the CA" primitive.
class CsrSigner {
public:
    virtual ~CsrSigner() = default;

    /**
     * @brief Issue a certificate for a CSR
     *
     * @param csr CSR in DER or PEM form
     * @return DER of the issued certificate
     * @throws std::runtime_error on any parse, policy or signing failure
     */
    virtual BinaryData Sign(const BinaryData& csr,
                            X509* ca_cert,
                            EVP_PKEY* ca_key,
                            const ExtKeyUsages& usages,
                            std::chrono::seconds validity) const
        = 0;
};

// Default OpenSSL implementation: subject and subjectAltName come from the CSR.
class X509CsrSigner : public CsrSigner {
public:
    BinaryData Sign(const BinaryData& csr,
                    X509* ca_cert,
                    EVP_PKEY* ca_key,
                    const ExtKeyUsages& usages,
                    std::chrono::seconds validity) const override;
};

class CertificateSigner {
public:
    CertificateSigner(const RootOfTrust& root,
                      const EnrollmentSettings& settings,
                      std::unique_ptr<CsrSigner> signer = std::make_unique<X509CsrSigner>());

    /**
     * @brief Sign a CSR with usages taken from the Ext-Key-Usages header
     *
     * @param usages_header empty for the {clientAuth} default, otherwise a JSON list
     * @return the issued certificate in PEM form
     * @throws SignError when the usages cannot be parsed or signing fails
     */
    std::string Sign(const BinaryData& csr, std::string_view usages_header) const;

    std::string Sign(const BinaryData& csr, const ExtKeyUsages& usages) const;

    // Configured days times 24h.
    std::chrono::hours validity() const { return validity_; }

private:
    const RootOfTrust& root_;
    std::chrono::hours validity_;
    std::unique_ptr<CsrSigner> signer_;
};

} // namespace edgegate::core
