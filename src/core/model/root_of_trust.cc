#include <core/model/root_of_trust.h>
#include <stdexcept>

namespace edgegate::core {

RootOfTrust::RootOfTrust(std::string_view certificate_pem, std::string_view private_key_pem)
    : certificate_(OpenSSLProvider::ParseCertificatePem(certificate_pem))
    , private_key_(OpenSSLProvider::ParsePrivateKeyPem(private_key_pem)) {
    if (X509_check_private_key(certificate_.get(), private_key_.get()) != 1) {
        throw std::runtime_error("CA private key does not match CA certificate");
    }
    certificate_der_ = OpenSSLProvider::CertificateToDer(certificate_.get());
    private_key_der_ = OpenSSLProvider::PrivateKeyToDer(private_key_.get());
    certificate_hash_ = OpenSSLProvider::Sha256Hex(certificate_der_);
}

} // namespace edgegate::core
