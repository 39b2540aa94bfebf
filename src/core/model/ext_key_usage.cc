#include <array>
#include <cstdint>
#include <core/model/ext_key_usage.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

using json = nlohmann::json;

namespace edgegate::core {

namespace {

struct UsageName {
    ExtKeyUsage usage;
    std::string_view name;
    std::string_view openssl;
};

constexpr std::array<UsageName, 14> kUsageNames{{
    {ExtKeyUsage::kAny, "any", "anyExtendedKeyUsage"},
    {ExtKeyUsage::kServerAuth, "serverAuth", "serverAuth"},
    {ExtKeyUsage::kClientAuth, "clientAuth", "clientAuth"},
    {ExtKeyUsage::kCodeSigning, "codeSigning", "codeSigning"},
    {ExtKeyUsage::kEmailProtection, "emailProtection", "emailProtection"},
    {ExtKeyUsage::kIpsecEndSystem, "ipsecEndSystem", "ipsecEndSystem"},
    {ExtKeyUsage::kIpsecTunnel, "ipsecTunnel", "ipsecTunnel"},
    {ExtKeyUsage::kIpsecUser, "ipsecUser", "ipsecUser"},
    {ExtKeyUsage::kTimeStamping, "timeStamping", "timeStamping"},
    {ExtKeyUsage::kOcspSigning, "OCSPSigning", "OCSPSigning"},
    {ExtKeyUsage::kMicrosoftServerGatedCrypto, "msSGC", "msSGC"},
    {ExtKeyUsage::kNetscapeServerGatedCrypto, "nsSGC", "nsSGC"},
    {ExtKeyUsage::kMicrosoftCommercialCodeSigning, "msCodeCom", "msCodeCom"},
    {ExtKeyUsage::kMicrosoftKernelCodeSigning, "msKernelCodeSigning", "1.3.6.1.4.1.311.61.1.1"},
}};

} // namespace

std::optional<ExtKeyUsage> ExtKeyUsageFromInt(int value) {
    if (value < 0 || value >= static_cast<int>(kUsageNames.size())) {
        return std::nullopt;
    }
    return static_cast<ExtKeyUsage>(value);
}

std::optional<ExtKeyUsage> ExtKeyUsageFromName(std::string_view name) {
    for (const auto& entry : kUsageNames) {
        if (entry.name == name) {
            return entry.usage;
        }
    }
    return std::nullopt;
}

std::string_view ExtKeyUsageToString(ExtKeyUsage usage) {
    return kUsageNames[static_cast<std::size_t>(usage)].name;
}

std::string_view ExtKeyUsageToOpenSSL(ExtKeyUsage usage) {
    return kUsageNames[static_cast<std::size_t>(usage)].openssl;
}

ExtKeyUsages ParseExtKeyUsages(std::string_view header_value) {
    if (header_value.empty()) {
        return {ExtKeyUsage::kClientAuth};
    }

    json data;
    try {
        data = json::parse(header_value);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(e.what());
    }
    if (!data.is_array()) {
        throw std::invalid_argument(fmt::format("expected a JSON array, got {}", data.type_name()));
    }

    ExtKeyUsages usages;
    for (const auto& item : data) {
        std::optional<ExtKeyUsage> usage;
        if (item.is_number_integer()) {
            auto value = item.get<std::int64_t>();
            if (value >= 0 && value < static_cast<std::int64_t>(kUsageNames.size())) {
                usage = ExtKeyUsageFromInt(static_cast<int>(value));
            }
        } else if (item.is_string()) {
            usage = ExtKeyUsageFromName(item.get<std::string>());
        }
        if (!usage) {
            throw std::invalid_argument(fmt::format("unknown extended key usage {}", item.dump()));
        }
        usages.push_back(*usage);
    }

    if (usages.empty()) {
        usages.push_back(ExtKeyUsage::kClientAuth);
    }
    return usages;
}

} // namespace edgegate::core
