#include "utils.h"
#include <catch2/catch.hpp>
#include <cstdlib>

TEST_CASE("Repeating log lines are throttled", "[utils][logging]") {
    using steady = std::chrono::steady_clock;
    LogThrottle throttle(std::chrono::seconds(5));
    const steady::time_point t0 = steady::now();
    int suppressed = -1;

    REQUIRE(throttle.allow(t0, suppressed));
    REQUIRE(suppressed == 0);

    // A frame loop hitting the same condition many times within the window
    for (int i = 1; i <= 20; ++i) {
        REQUIRE_FALSE(throttle.allow(t0 + std::chrono::milliseconds(200 * i), suppressed));
    }

    REQUIRE(throttle.allow(t0 + std::chrono::seconds(5), suppressed));
    REQUIRE(suppressed == 20);

    REQUIRE_FALSE(throttle.allow(t0 + std::chrono::seconds(6), suppressed));
    REQUIRE(throttle.allow(t0 + std::chrono::seconds(11), suppressed));
    REQUIRE(suppressed == 1);
}

TEST_CASE("Clamped integer environment values", "[utils][config]") {
    setenv("PANEL_TEST_INT", "250", 1);
    REQUIRE(getenv_int_clamped("PANEL_TEST_INT", 10, 1, 100) == 100);
    setenv("PANEL_TEST_INT", "-4", 1);
    REQUIRE(getenv_int_clamped("PANEL_TEST_INT", 10, 1, 100) == 1);
    setenv("PANEL_TEST_INT", "oops", 1);
    REQUIRE(getenv_int_clamped("PANEL_TEST_INT", 10, 1, 100) == 10);
    unsetenv("PANEL_TEST_INT");
    REQUIRE(getenv_int_clamped("PANEL_TEST_INT", 10, 1, 100) == 10);
}
