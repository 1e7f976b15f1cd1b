#include <catch2/catch_test_macros.hpp>

#include "terminal/retry_policy.hpp"

using namespace std::chrono_literals;

TEST_CASE("RetryPolicy", "[retry]") {

    SECTION("DefaultsAreTenAttemptsHalfSecondApart") {
        RetryPolicy policy;
        REQUIRE(policy.max_attempts == 10);
        REQUIRE(policy.delay(1) == 500ms);
        REQUIRE(policy.delay(9) == 500ms);
    }

    SECTION("WorstCaseSkipsDelayAfterLastAttempt") {
        RetryPolicy policy;
        REQUIRE(policy.worst_case_total() == 4500ms);
    }

    SECTION("BackoffGrowsAndCaps") {
        RetryPolicy policy{.max_attempts = 6, .interval = 100ms, .backoff = 2.0, .max_interval = 500ms};
        REQUIRE(policy.delay(1) == 100ms);
        REQUIRE(policy.delay(2) == 200ms);
        REQUIRE(policy.delay(3) == 400ms);
        REQUIRE(policy.delay(4) == 500ms);
        REQUIRE(policy.delay(5) == 500ms);
        REQUIRE(policy.worst_case_total() == 1700ms);
    }

    SECTION("AttemptBelowOneTreatedAsFirst") {
        RetryPolicy policy{.interval = 100ms, .backoff = 3.0};
        REQUIRE(policy.delay(0) == 100ms);
        REQUIRE(policy.delay(-2) == 100ms);
    }

    SECTION("SingleAttemptNeverSleeps") {
        RetryPolicy policy{.max_attempts = 1};
        REQUIRE(policy.worst_case_total() == 0ms);
    }
}
