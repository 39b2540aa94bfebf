#pragma once

#include <core/model/root_of_trust.h>
#include <optional>
#include <string>
#include <string_view>

namespace edgegate::core {

namespace subject {

// Certificates issued before node-scoped subjects existed. Accepted for migration only.
constexpr std::string_view kLegacyOrganization = "KubeEdge";
constexpr std::string_view kLegacyCommonName = "kubeedge.io";

constexpr std::string_view kNodesOrganization = "system:nodes";
constexpr std::string_view kNodeCommonNamePrefix = "system:node:";

} // namespace subject

struct CertificateSubject {
    std::optional<std::string> organization; // first O attribute
    std::string common_name;                 // last CN attribute
};

class TrustVerifier {
public:
    TrustVerifier(const RootOfTrust& root, bool allow_legacy_subject);

    /**
     * @brief Verify a client certificate against the CA and the claimed node name
     *
     * @throws AuthError if the chain does not verify for client authentication,
     *         or the subject does not belong to the claimed node
     */
    void Verify(X509* cert, std::string_view node_name) const;

    /**
     * @brief Subject naming policy alone, without chain verification
     *
     * @throws AuthError on mismatch
     */
    void VerifySubject(X509* cert, std::string_view node_name) const;

    static CertificateSubject ReadSubject(X509* cert);

private:
    void verifyChain(X509* cert) const;

    const RootOfTrust& root_;
    bool allow_legacy_subject_;
};

} // namespace edgegate::core
