#pragma once

#include <string>

namespace regionrouter::http {

inline constexpr const char* kJsonContentType = "application/json";

// Query parameters of GET /route
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kCountryParam = "country";
inline const std::string kCapabilityParam = "capability";
inline const std::string kResidencyParam = "residency";

} // namespace regionrouter::http
