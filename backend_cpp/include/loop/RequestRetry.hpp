#pragma once
#include <string>
#include <algorithm>
#include <spdlog/spdlog.h>
#include "domain/Errors.hpp"

namespace code_validation {

// Re-issues a sandbox call while it fails at the transport level. Every other
// ExecutionError (NotFound, BadRequest, 5xx, ...) is rethrown on the spot.
// No pause between attempts.
template<typename Func>
auto with_request_retries(Func request, int max_attempts, const std::string& operation) -> decltype(request()) {
    const int attempts = std::max(1, max_attempts);
    for (int attempt = 1;; ++attempt) {
        try {
            return request();
        } catch (const SandboxUnreachable& e) {
            if (attempt >= attempts) {
                spdlog::error("❌ {}: sandbox unreachable after {} attempts", operation, attempts);
                throw;
            }
            spdlog::warn("🔁 {}: attempt {}/{} failed: {}", operation, attempt, attempts, e.what());
        }
    }
}

}
