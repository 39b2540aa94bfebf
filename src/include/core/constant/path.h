#pragma once

#include <filesystem>

namespace edgegate::core {
namespace path {

inline const std::filesystem::path kConfigDir = "/etc/edgegate";

inline const std::filesystem::path kConfigFile = kConfigDir / "edgegate.toml";

inline const std::filesystem::path kCaDir = kConfigDir / "ca";

inline const std::filesystem::path kCertificateDir = kConfigDir / "certs";

inline const std::filesystem::path kLogDir = "/var/log/edgegate";

} // namespace path
} // namespace edgegate::core
