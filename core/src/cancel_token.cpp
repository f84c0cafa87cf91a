#include "core/cancel_token.h"

namespace evx::core {

void CancelToken::request_cancel() noexcept {
  canceled_.store(true, std::memory_order_release);
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace evx::core
