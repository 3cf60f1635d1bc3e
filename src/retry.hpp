#pragma once
#include "cancellation.hpp"
#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

namespace junkrat {

struct BackoffPolicy {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double factor = 2.0;
    bool jitter = true;
};

struct RetryOptions {
    uint32_t max_retries = 3;
    BackoffPolicy backoff;

    // Decides whether a failure is worth another attempt. Defaults to
    // is_retryable() when empty. `attempt` is the 0-based failed attempt.
    std::function<bool(const std::exception& error, uint32_t attempt)> should_retry;

    // Notified before each backoff wait with the 1-based retry number.
    std::function<void(uint32_t retry, std::chrono::milliseconds delay,
                       const std::exception& error)> on_retry;

    CancellationToken token;
    std::string provider_id; // attributed to the cancellation error
};

// Backoff before the retry that follows failure `failure_index`, without jitter:
// min(initial_delay * factor^failure_index, max_delay).
std::chrono::milliseconds backoff_delay(const RetryOptions& options, uint32_t failure_index);

// backoff_delay() with jitter applied when enabled (uniform in [0, delay)).
std::chrono::milliseconds retry_delay(const RetryOptions& options, uint32_t failure_index);

// Throws a Cancelled (or Timeout, for an expired deadline) ProviderError if
// the token has fired.
void throw_if_cancelled(const CancellationToken& token, const std::string& provider_id);

// Run `operation` up to max_retries + 1 times, sleeping with backoff between
// attempts. Cancellation is checked before every attempt and interrupts the
// backoff wait. Non-retryable failures and the final failure are rethrown
// unchanged.
template <typename Operation>
auto retry(Operation&& operation, const RetryOptions& options) -> decltype(operation()) {
    for (uint32_t attempt = 0;; ++attempt) {
        throw_if_cancelled(options.token, options.provider_id);
        try {
            return operation();
        } catch (const std::exception& e) {
            bool wanted = options.should_retry ? options.should_retry(e, attempt)
                                               : is_retryable(e);
            if (attempt >= options.max_retries || !wanted) throw;

            auto delay = retry_delay(options, attempt);
            if (options.on_retry) options.on_retry(attempt + 1, delay, e);
            if (options.token.wait_for(delay)) {
                throw_if_cancelled(options.token, options.provider_id);
            }
        }
    }
}

} // namespace junkrat
