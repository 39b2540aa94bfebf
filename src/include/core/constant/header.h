#pragma once

#include <string_view>

namespace edgegate::core {

namespace header {

constexpr std::string_view kNodeName = "Node-Name";
constexpr std::string_view kAuthorization = "Authorization";
constexpr std::string_view kExtKeyUsages = "Ext-Key-Usages";
constexpr std::string_view kForwardedClientCert = "X-Forwarded-Client-Cert";

} // namespace header

} // namespace edgegate::core
