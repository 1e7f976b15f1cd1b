#include "terminal/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

std::chrono::milliseconds RetryPolicy::delay(int attempt) const {
    if (attempt < 1) attempt = 1;
    if (backoff <= 1.0) return interval;

    double scaled = static_cast<double>(interval.count()) * std::pow(backoff, attempt - 1);
    double capped = std::min(scaled, static_cast<double>(max_interval.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

std::chrono::milliseconds RetryPolicy::worst_case_total() const {
    std::chrono::milliseconds total{0};
    for (int attempt = 1; attempt < max_attempts; ++attempt) {
        total += delay(attempt);
    }
    return total;
}
