#include "retry.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace junkrat {

std::chrono::milliseconds backoff_delay(const RetryOptions& options, uint32_t failure_index) {
    const BackoffPolicy& policy = options.backoff;
    double base = static_cast<double>(policy.initial_delay.count()) *
                  std::pow(policy.factor, static_cast<double>(failure_index));
    double capped = std::min(base, static_cast<double>(policy.max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

std::chrono::milliseconds retry_delay(const RetryOptions& options, uint32_t failure_index) {
    auto delay = backoff_delay(options, failure_index);
    if (!options.backoff.jitter || delay.count() <= 0) return delay;

    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(delay.count()) * dist(gen)));
}

void throw_if_cancelled(const CancellationToken& token, const std::string& provider_id) {
    switch (token.reason()) {
        case CancelReason::None:
            return;
        case CancelReason::Cancelled:
            throw ProviderError(ErrorKind::Cancelled, "Operation cancelled", provider_id);
        case CancelReason::TimedOut:
            throw ProviderError(ErrorKind::Timeout, "Operation timed out", provider_id);
    }
}

} // namespace junkrat
