#pragma once

#include <core/security/open_ssl_provider.h>
#include <core/util/binary_data.h>
#include <string>
#include <string_view>

namespace edgegate::core {

// CA certificate and key. Built once at startup and only read afterwards,
// so every request shares it through a const reference without locking.
class RootOfTrust {
public:
    // Throws std::runtime_error when the pair cannot be parsed or does not match.
    RootOfTrust(std::string_view certificate_pem, std::string_view private_key_pem);

    RootOfTrust(const RootOfTrust&) = delete;
    RootOfTrust& operator=(const RootOfTrust&) = delete;
    RootOfTrust(RootOfTrust&&) = default;
    RootOfTrust& operator=(RootOfTrust&&) = default;

    X509* certificate() const { return certificate_.get(); }
    EVP_PKEY* private_key() const { return private_key_.get(); }

    const BinaryData& certificate_der() const { return certificate_der_; }
    const BinaryData& private_key_der() const { return private_key_der_; }

    // SHA-256 of the certificate DER, the value edge nodes pin during bootstrap.
    const std::string& certificate_hash() const { return certificate_hash_; }

private:
    X509Ptr certificate_;
    EvpPkeyPtr private_key_;
    BinaryData certificate_der_;
    BinaryData private_key_der_;
    std::string certificate_hash_;
};

} // namespace edgegate::core
