#pragma once

#include <core/model/root_of_trust.h>
#include <core/model/security_context.h>
#include <core/util/config.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace edgegate::core {

class CertificateManager {
public:
    explicit CertificateManager(const CaSettings& settings);

    /**
     * @brief Load the CA and the serving certificate, creating whatever is missing
     *
     * A missing CA (both files absent) is generated and persisted. A missing serving
     * certificate is issued by the CA. A CA with only one of its two files present
     * is an error, never silently replaced.
     *
     * @return false if any step fails; the reason is logged
     */
    bool InitSecurityContext();

    // Valid only after a successful InitSecurityContext().
    const RootOfTrust& root_of_trust() const;

    const SecurityContext& security_context() const;

    // RSA 2048 key pair.
    static EvpPkeyPtr GeneratePrivateKey();

    static X509Ptr GenerateCaCertificate(EVP_PKEY* key, const std::string& common_name);

    // PEM CSR for `key` with the given subject and subjectAltName entries such as
    // "DNS:localhost" or "IP:127.0.0.1".
    static std::string CreateCsr(EVP_PKEY* key,
                                 const std::string& organization,
                                 const std::string& common_name,
                                 const std::vector<std::string>& alt_names = {});

private:
    bool loadOrCreateRootOfTrust();

    bool loadOrCreateServerCertificate();

    static std::string readFile(const std::filesystem::path& path);

    static void writeFile(const std::filesystem::path& path,
                          const std::string& content,
                          bool is_secret);

    CaSettings settings_;
    std::optional<RootOfTrust> root_;
    SecurityContext security_context_;

    static constexpr int kKeyBits = 2048;
};

} // namespace edgegate::core
