#pragma once

#include <string>
#include <string_view>

namespace promptguard::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr std::string_view kGenericError = R"({"detail":"Internal Server Error"})";
inline constexpr std::string_view kShuttingDown = R"({"detail":"Service shutting down"})";

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kRequestIdHeader = "X-Request-Id";

} // namespace promptguard::http
