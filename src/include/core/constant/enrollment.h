#pragma once

#include <cstddef>

namespace edgegate::core {

namespace enrollment {

constexpr int kDefaultSigningDurationDays = 365;
constexpr int kDefaultTokenRefreshHours = 12;
constexpr int kCaValidityDays = 3650;
constexpr int kServerCertValidityDays = 3650;

constexpr std::size_t kMaxCsrBodyBytes = 1 * 1024 * 1024;     // 1 MB
constexpr std::size_t kMaxRequestBodyBytes = 8 * 1024 * 1024; // 8 MB

} // namespace enrollment

} // namespace edgegate::core
