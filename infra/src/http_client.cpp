#include "infra/http_client.h"

#include <charconv>

namespace evx::infra {

evx::core::TaskError make_http_error(
    HttpErrorCode code,
    const std::string &user_message,
    const std::string &internal_message,
    bool retryable
) {
  evx::core::ErrorCategory category = evx::core::ErrorCategory::Network;
  if (code == HttpErrorCode::CANCELED) {
    category = evx::core::ErrorCategory::Interrupted;
    retryable = false;
  }

  std::map<std::string, std::string> details = {
      {"http_error_code", std::to_string(static_cast<int>(code))}};

  return evx::core::TaskError(category, static_cast<int>(code), retryable,
                              user_message, internal_message, details);
}

HttpErrorCode http_error_code(const evx::core::TaskError &error) {
  const auto it = error.details.find("http_error_code");
  if (it == error.details.end()) {
    return HttpErrorCode::UNKNOWN;
  }

  int parsed = 0;
  const std::string &value = it->second;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return HttpErrorCode::UNKNOWN;
  }
  return static_cast<HttpErrorCode>(parsed);
}

} // namespace evx::infra
