#include <core/constant/enrollment.h>
#include <core/model/ext_key_usage.h>
#include <core/security/certificate_manager.h>
#include <core/security/certificate_signer.h>
#include <fstream>
#include <openssl/bn.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace edgegate::core {

namespace {

constexpr const char* kOrganization = "edgegate";

std::string localHostname() {
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
        return "localhost";
    }
    return hostname;
}

void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (X509_NAME_add_entry_by_txt(name,
                                   field,
                                   MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(value.c_str()),
                                   -1,
                                   -1,
                                   0)
        != 1) {
        throw std::runtime_error(std::string("failed to set subject field ") + field);
    }
}

} // namespace

CertificateManager::CertificateManager(const CaSettings& settings)
    : settings_(settings) {
    OpenSSLProvider::InitOpenSSL();
}

bool CertificateManager::InitSecurityContext() {
    if (!loadOrCreateRootOfTrust()) {
        return false;
    }
    spdlog::info("Root of trust ready, CA fingerprint: {}", root_->certificate_hash());

    if (!loadOrCreateServerCertificate()) {
        return false;
    }
    spdlog::info("Serving certificate ready, fingerprint: {}", security_context_.certificate_hash);
    return true;
}

const RootOfTrust& CertificateManager::root_of_trust() const {
    if (!root_) {
        throw std::logic_error("root of trust requested before InitSecurityContext()");
    }
    return *root_;
}

const SecurityContext& CertificateManager::security_context() const {
    return security_context_;
}

EvpPkeyPtr CertificateManager::GeneratePrivateKey() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!ctx || EVP_PKEY_keygen_init(ctx) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize RSA key generation");
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, kKeyBits) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("Failed to set RSA key size");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx, &pkey) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("Failed to generate RSA key pair");
    }
    EVP_PKEY_CTX_free(ctx);
    return EvpPkeyPtr(pkey);
}

X509Ptr CertificateManager::GenerateCaCertificate(EVP_PKEY* key, const std::string& common_name) {
    X509Ptr x509 = OpenSSLProvider::Adopt(X509_new());
    if (!x509) {
        throw std::runtime_error("Failed to allocate CA certificate");
    }

    X509_set_version(x509.get(), 2);

    std::unique_ptr<BIGNUM, decltype(&BN_free)> serial(BN_new(), &BN_free);
    if (!serial || BN_rand(serial.get(), 128, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1
        || !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(x509.get()))) {
        throw std::runtime_error("Failed to set CA serial number");
    }

    X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(x509.get()),
                    60L * 60 * 24 * enrollment::kCaValidityDays);

    X509_set_pubkey(x509.get(), key);

    X509_NAME* name = X509_get_subject_name(x509.get());
    addNameEntry(name, "O", kOrganization);
    addNameEntry(name, "CN", common_name);
    X509_set_issuer_name(x509.get(), name); // Self is the issuer

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, x509.get(), x509.get(), nullptr, nullptr, 0);
    const std::pair<int, const char*> extensions[] = {
        {NID_basic_constraints, "critical,CA:TRUE"},
        {NID_key_usage, "critical,digitalSignature,keyEncipherment,keyCertSign,cRLSign"},
        {NID_subject_key_identifier, "hash"},
    };
    for (const auto& [nid, value] : extensions) {
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value);
        if (!ext || X509_add_ext(x509.get(), ext, -1) != 1) {
            X509_EXTENSION_free(ext);
            throw std::runtime_error(std::string("Failed to add CA extension ") + OBJ_nid2sn(nid));
        }
        X509_EXTENSION_free(ext);
    }

    if (X509_sign(x509.get(), key, EVP_sha256()) == 0) {
        throw std::runtime_error("Failed to sign CA certificate");
    }
    return x509;
}

std::string CertificateManager::CreateCsr(EVP_PKEY* key,
                                          const std::string& organization,
                                          const std::string& common_name,
                                          const std::vector<std::string>& alt_names) {
    X509ReqPtr req(X509_REQ_new());
    if (!req || X509_REQ_set_version(req.get(), 0) != 1) {
        throw std::runtime_error("Failed to allocate certificate request");
    }

    X509_NAME* name = X509_REQ_get_subject_name(req.get());
    if (!organization.empty()) {
        addNameEntry(name, "O", organization);
    }
    addNameEntry(name, "CN", common_name);

    if (!alt_names.empty()) {
        std::string san;
        for (const auto& alt_name : alt_names) {
            san += san.empty() ? alt_name : "," + alt_name;
        }
        STACK_OF(X509_EXTENSION)* exts = sk_X509_EXTENSION_new_null();
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, nullptr, NID_subject_alt_name,
                                                  san.c_str());
        if (!exts || !ext) {
            X509_EXTENSION_free(ext);
            sk_X509_EXTENSION_free(exts);
            throw std::runtime_error("Failed to build subjectAltName: " + san);
        }
        sk_X509_EXTENSION_push(exts, ext);
        int ok = X509_REQ_add_extensions(req.get(), exts);
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
        if (ok != 1) {
            throw std::runtime_error("Failed to add extensions to certificate request");
        }
    }

    if (X509_REQ_set_pubkey(req.get(), key) != 1
        || X509_REQ_sign(req.get(), key, EVP_sha256()) <= 0) {
        throw std::runtime_error("Failed to sign certificate request");
    }

    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509_REQ(bio.get(), req.get()) != 1) {
        throw std::runtime_error("Failed to encode certificate request");
    }
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio.get(), &buf);
    return std::string(buf, static_cast<std::size_t>(len));
}

bool CertificateManager::loadOrCreateRootOfTrust() {
    bool has_cert = fs::exists(settings_.cert_file);
    bool has_key = fs::exists(settings_.key_file);

    try {
        if (has_cert && has_key) {
            root_.emplace(readFile(settings_.cert_file), readFile(settings_.key_file));
            spdlog::info("Loaded CA certificate from {}", settings_.cert_file.string());
            return true;
        }
        if (has_cert || has_key) {
            spdlog::error("Incomplete CA: found only {}, refusing to generate a new one",
                          has_cert ? settings_.cert_file.string() : settings_.key_file.string());
            return false;
        }

        spdlog::info("No CA found, generating a new self-signed CA...");
        EvpPkeyPtr key = GeneratePrivateKey();
        X509Ptr cert = GenerateCaCertificate(key.get(), "edgegate-ca");
        std::string cert_pem = OpenSSLProvider::CertificateToPem(cert.get());
        std::string key_pem = OpenSSLProvider::PrivateKeyToPem(key.get());

        writeFile(settings_.key_file, key_pem, true);
        writeFile(settings_.cert_file, cert_pem, false);
        root_.emplace(cert_pem, key_pem);
        spdlog::info("Generated CA certificate at {}", settings_.cert_file.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load root of trust: {}", e.what());
        return false;
    }
}

bool CertificateManager::loadOrCreateServerCertificate() {
    try {
        if (fs::exists(settings_.server_cert_file) && fs::exists(settings_.server_key_file)) {
            security_context_.certificate_pem = readFile(settings_.server_cert_file);
            security_context_.private_key_pem = readFile(settings_.server_key_file);
            X509Ptr cert = OpenSSLProvider::ParseCertificatePem(security_context_.certificate_pem);
            EvpPkeyPtr key = OpenSSLProvider::ParsePrivateKeyPem(security_context_.private_key_pem);
            if (X509_check_private_key(cert.get(), key.get()) != 1) {
                spdlog::error("Serving key {} does not match certificate {}",
                              settings_.server_key_file.string(),
                              settings_.server_cert_file.string());
                return false;
            }
            security_context_.certificate_hash = OpenSSLProvider::Sha256Hex(
                OpenSSLProvider::CertificateToDer(cert.get()));
            return true;
        }

        spdlog::info("No serving certificate found, issuing one from the CA...");
        std::string hostname = localHostname();
        EvpPkeyPtr key = GeneratePrivateKey();
        std::string csr = CreateCsr(key.get(),
                                    kOrganization,
                                    hostname,
                                    {"DNS:" + hostname, "DNS:localhost", "IP:127.0.0.1"});

        X509CsrSigner signer;
        BinaryData der = signer.Sign(ToBinary(csr),
                                     root_->certificate(),
                                     root_->private_key(),
                                     {ExtKeyUsage::kServerAuth},
                                     std::chrono::hours(24) * enrollment::kServerCertValidityDays);
        X509Ptr cert = OpenSSLProvider::ParseCertificateDer(der);

        security_context_.certificate_pem = OpenSSLProvider::CertificateToPem(cert.get());
        security_context_.private_key_pem = OpenSSLProvider::PrivateKeyToPem(key.get());
        security_context_.certificate_hash = OpenSSLProvider::Sha256Hex(der);

        writeFile(settings_.server_key_file, security_context_.private_key_pem, true);
        writeFile(settings_.server_cert_file, security_context_.certificate_pem, false);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to prepare serving certificate: {}", e.what());
        return false;
    }
}

std::string CertificateManager::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::stringstream stream;
    stream << file.rdbuf();
    return stream.str();
}

void CertificateManager::writeFile(const fs::path& path, const std::string& content, bool is_secret) {
    if (path.has_parent_path() && !fs::exists(path.parent_path())) {
        fs::create_directories(path.parent_path());
    }
    // The file is created empty and locked down before any key material reaches it.
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot write " + path.string());
    }
    if (is_secret) {
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    }
    file << content;
    file.close();
    if (!file) {
        throw std::runtime_error("failed writing " + path.string());
    }
}

} // namespace edgegate::core
