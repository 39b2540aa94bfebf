#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/security/open_ssl_provider.h>
#include <exception>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace ssl = boost::asio::ssl;
namespace uuids = boost::uuids;

namespace edgegate::core {

OpenSSLProvider::~OpenSSLProvider() {
    if (initialized_) {
        // Though OpenSSL will automatically clean up since 1.1.0,
        // keeping this for backward compatibility
        EVP_cleanup();
        ERR_free_strings();
        CRYPTO_cleanup_all_ex_data();
        initialized_ = false;
    }
}

OpenSSLProvider& OpenSSLProvider::instance() {
    static OpenSSLProvider instance;
    return instance;
}

std::string OpenSSLProvider::createSessionId(std::string_view prefix) {
    uuids::random_generator gen;
    uuids::uuid id = gen();
    std::string uuid_str = uuids::to_string(id);
    return std::string(prefix) + "_" + uuid_str;
}

void OpenSSLProvider::InitOpenSSL() {
    if (!instance().initialized_) {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr)
            != 1) {
            spdlog::error("OPENSSL_init_ssl failed");
            std::terminate();
        }
        instance().initialized_ = true;
    }
}

ssl::context OpenSSLProvider::BuildServerContext(std::string_view cert_pem,
                                                 std::string_view key_pem) {
    ssl::context ctx(ssl::context::tlsv12_server);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::single_dh_use);

    ctx.use_certificate(boost::asio::buffer(cert_pem.data(), cert_pem.size()), ssl::context::pem);
    ctx.use_private_key(boost::asio::buffer(key_pem.data(), key_pem.size()), ssl::context::pem);

    // Client certificates are verified by the enrollment handler against the CA,
    // so the handshake only has to collect them.
    std::string session_id_context = createSessionId("edgegate_server");
    SSL_CTX_set_session_id_context(ctx.native_handle(),
                                   reinterpret_cast<const unsigned char*>(
                                       session_id_context.c_str()),
                                   static_cast<unsigned int>(
                                       std::min<std::size_t>(session_id_context.length(),
                                                             SSL_MAX_SID_CTX_LENGTH)));
    ctx.set_verify_mode(ssl::verify_peer);
    ctx.set_verify_callback([](bool preverified, ssl::verify_context& vctx) {
        if (!preverified) {
            int depth = X509_STORE_CTX_get_error_depth(vctx.native_handle());
            int err = X509_STORE_CTX_get_error(vctx.native_handle());
            spdlog::debug("Collecting unverified client certificate at depth {}: {}",
                          depth,
                          X509_verify_cert_error_string(err));
        }
        return true;
    });

    return ctx;
}

X509Ptr OpenSSLProvider::Adopt(X509* cert) {
    return X509Ptr(cert, X509Deleter{});
}

X509Ptr OpenSSLProvider::ParseCertificateDer(const BinaryData& der) {
    if (der.empty()) {
        throw std::runtime_error("empty certificate data");
    }
    const unsigned char* cursor = der.data();
    const unsigned char* end = cursor + der.size();
    X509Ptr cert = Adopt(d2i_X509(nullptr, &cursor, static_cast<long>(der.size())));
    if (!cert) {
        throw std::runtime_error("x509: malformed certificate: " + LastError());
    }
    if (cursor != end) {
        throw std::runtime_error("x509: trailing data after certificate");
    }
    return cert;
}

X509Ptr OpenSSLProvider::ParseCertificatePem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw std::runtime_error("failed to allocate memory BIO");
    }
    X509Ptr cert = Adopt(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        throw std::runtime_error("failed to parse PEM certificate: " + LastError());
    }
    return cert;
}

EvpPkeyPtr OpenSSLProvider::ParsePrivateKeyPem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw std::runtime_error("failed to allocate memory BIO");
    }
    EvpPkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw std::runtime_error("failed to parse PEM private key: " + LastError());
    }
    return key;
}

BinaryData OpenSSLProvider::CertificateToDer(X509* cert) {
    int len = i2d_X509(cert, nullptr);
    if (len <= 0) {
        throw std::runtime_error("failed to encode certificate: " + LastError());
    }
    BinaryData der(static_cast<std::size_t>(len));
    unsigned char* out = der.data();
    i2d_X509(cert, &out);
    return der;
}

std::string OpenSSLProvider::CertificateToPem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw std::runtime_error("failed to write PEM certificate: " + LastError());
    }
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio.get(), &buf);
    return std::string(buf, static_cast<std::size_t>(len));
}

BinaryData OpenSSLProvider::PrivateKeyToDer(EVP_PKEY* key) {
    int len = i2d_PrivateKey(key, nullptr);
    if (len <= 0) {
        throw std::runtime_error("failed to encode private key: " + LastError());
    }
    BinaryData der(static_cast<std::size_t>(len));
    unsigned char* out = der.data();
    i2d_PrivateKey(key, &out);
    return der;
}

std::string OpenSSLProvider::PrivateKeyToPem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio
        || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr)
               != 1) {
        throw std::runtime_error("failed to write PEM private key: " + LastError());
    }
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio.get(), &buf);
    return std::string(buf, static_cast<std::size_t>(len));
}

// Calculate SHA-256 digest as lowercase hex
std::string OpenSSLProvider::Sha256Hex(const BinaryData& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(mdctx, data.data(), data.size());
    EVP_DigestFinal_ex(mdctx, hash, &hash_len);
    EVP_MD_CTX_free(mdctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string OpenSSLProvider::LastError() {
    std::string message;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!message.empty()) {
            message += "; ";
        }
        message += buf;
    }
    return message.empty() ? "unknown error" : message;
}

} // namespace edgegate::core
