#pragma once

#include <core/security/open_ssl_provider.h>
#include <string_view>

namespace edgegate::core {

class ProxyCertificateExtractor {
public:
    /**
     * @brief Decode a certificate forwarded by a TLS-terminating proxy
     *
     * The header value is base64 of either PEM text or a raw DER certificate. For PEM,
     * the first CERTIFICATE block wins and blocks of other types are skipped. Line
     * breaks and spaces inside block bodies are tolerated.
     *
     * @param header_value value of the X-Forwarded-Client-Cert header
     * @return the decoded certificate, never null
     * @throws ParseError when the value is not valid base64, PEM or DER
     */
    static X509Ptr Extract(std::string_view header_value);
};

} // namespace edgegate::core
