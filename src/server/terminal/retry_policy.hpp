#pragma once

#include <chrono>

// Bounded retry schedule for window discovery/focus. Attempts are 1-based.
struct RetryPolicy {
    int max_attempts = 10;
    std::chrono::milliseconds interval{500};
    double backoff = 1.0;                        // multiplier applied per attempt
    std::chrono::milliseconds max_interval{5000};

    // Delay to wait after a failed `attempt`, before the next one.
    std::chrono::milliseconds delay(int attempt) const;

    // Total time slept if every attempt fails (no delay after the last one).
    std::chrono::milliseconds worst_case_total() const;
};
