/**
 * @file open_ssl_provider.h
 * @brief providing OpenSSL headers, OpenSSL library initialization, owning handle types
 * and common certificate encoding operations
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <core/util/binary_data.h>
#include <memory>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <string>
#include <string_view>

namespace edgegate::core {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};

struct X509ReqDeleter {
    void operator()(X509_REQ* req) const { X509_REQ_free(req); }
};

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct X509StoreDeleter {
    void operator()(X509_STORE* store) const { X509_STORE_free(store); }
};

struct X509StoreCtxDeleter {
    void operator()(X509_STORE_CTX* ctx) const { X509_STORE_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509ReqPtr = std::unique_ptr<X509_REQ, X509ReqDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using X509StorePtr = std::unique_ptr<X509_STORE, X509StoreDeleter>;
using X509StoreCtxPtr = std::unique_ptr<X509_STORE_CTX, X509StoreCtxDeleter>;

// Certificates are shared between the connection and every request made on it,
// so they are reference counted through OpenSSL's own counter.
using X509Ptr = std::shared_ptr<X509>;

class OpenSSLProvider {
private:
    OpenSSLProvider() = default;
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;
    ~OpenSSLProvider();

    static OpenSSLProvider& instance();
    static std::string createSessionId(std::string_view prefix);

    bool initialized_ = false;

public:
    /**
     * @brief Initialize OpenSSL library
     *
     * This function should be called before using any OpenSSL functions.
     * It will only initialize once, can be called multiple times safely.
     */
    static void InitOpenSSL();

    /**
     * @brief Build a server SSL context with the given certificate and key in PEM format
     *
     * The context requests a client certificate but does not require one, and accepts
     * whatever the client presents. Trust decisions are made per request, after routing.
     *
     * @param cert_pem Certificate in PEM format
     * @param key_pem Private key in PEM format
     * @return boost::asio::ssl::context SSL context configured for server use
     */
    static boost::asio::ssl::context BuildServerContext(std::string_view cert_pem,
                                                        std::string_view key_pem);

    /**
     * @brief Take ownership of a raw certificate pointer
     */
    static X509Ptr Adopt(X509* cert);

    static X509Ptr ParseCertificateDer(const BinaryData& der);
    static X509Ptr ParseCertificatePem(std::string_view pem);
    static EvpPkeyPtr ParsePrivateKeyPem(std::string_view pem);

    static BinaryData CertificateToDer(X509* cert);
    static std::string CertificateToPem(X509* cert);
    static BinaryData PrivateKeyToDer(EVP_PKEY* key);
    static std::string PrivateKeyToPem(EVP_PKEY* key);

    static std::string Sha256Hex(const BinaryData& data);

    /**
     * @brief Drain the OpenSSL error queue into a readable string
     */
    static std::string LastError();
};

} // namespace edgegate::core
