#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edgegate::core {

// Numbering is the one edge agents put on the wire in the Ext-Key-Usages header.
enum class ExtKeyUsage : int {
    kAny = 0,
    kServerAuth = 1,
    kClientAuth = 2,
    kCodeSigning = 3,
    kEmailProtection = 4,
    kIpsecEndSystem = 5,
    kIpsecTunnel = 6,
    kIpsecUser = 7,
    kTimeStamping = 8,
    kOcspSigning = 9,
    kMicrosoftServerGatedCrypto = 10,
    kNetscapeServerGatedCrypto = 11,
    kMicrosoftCommercialCodeSigning = 12,
    kMicrosoftKernelCodeSigning = 13,
};

using ExtKeyUsages = std::vector<ExtKeyUsage>;

std::optional<ExtKeyUsage> ExtKeyUsageFromInt(int value);

std::optional<ExtKeyUsage> ExtKeyUsageFromName(std::string_view name);

std::string_view ExtKeyUsageToString(ExtKeyUsage usage);

// Value understood by OpenSSL's extendedKeyUsage extension config (short name or OID).
std::string_view ExtKeyUsageToOpenSSL(ExtKeyUsage usage);

/**
 * @brief Parse the Ext-Key-Usages header value
 *
 * An empty value, or an empty JSON array, yields {clientAuth}. Otherwise the value
 * must be a JSON array whose items are usage numbers or usage names.
 *
 * @throws std::invalid_argument when the value is not a valid usage list
 */
ExtKeyUsages ParseExtKeyUsages(std::string_view header_value);

} // namespace edgegate::core
