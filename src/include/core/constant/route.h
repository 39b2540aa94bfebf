#pragma once

#include <string_view>

namespace edgegate::core {

class ApiRoute {
public:
    static constexpr std::string_view kCaCertificate = "/ca.crt";
    static constexpr std::string_view kEdgeCertificate = "/edge.crt";
};

} // namespace edgegate::core
