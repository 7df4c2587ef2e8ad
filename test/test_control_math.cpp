// test/test_control_math.cpp
/**
 * Unit Test: shared numeric helpers
 *
 * Test Coverage:
 *   1. apply_deadzone inside / outside the band
 *   2. rate_limit up and down
 *   3. floor_mod sign convention
 *   4. interp with end clamping
 *   5. Model time grid
 */

#include "utils/control_math.hpp"
#include "lateral/model_time_grid.hpp"
#include "test_common.hpp"


void test_deadzone(TestResult& result) {
    section("Test 1: apply_deadzone");

    result.check(utils::apply_deadzone(3.0, 5.0) == 0.0, "apply_deadzone(3, 5) == 0");
    result.check(utils::apply_deadzone(7.0, 5.0) == 2.0, "apply_deadzone(7, 5) == 2");
    result.check(utils::apply_deadzone(-7.0, 5.0) == -2.0, "apply_deadzone(-7, 5) == -2");
    result.check(utils::apply_deadzone(5.0, 5.0) == 0.0, "apply_deadzone(5, 5) == 0 (band edge)");
    result.check(utils::apply_deadzone(-5.0, 5.0) == 0.0, "apply_deadzone(-5, 5) == 0 (band edge)");
    result.check(utils::apply_deadzone(0.3, 0.0) == 0.3, "zero deadzone passes error through");
}

void test_rate_limit(TestResult& result) {
    section("Test 2: rate_limit");

    result.check(utils::rate_limit(10.0, 5.0, -1.0, 2.0) == 7.0, "rate_limit(10, 5, -1, 2) == 7");
    result.check(utils::rate_limit(10.0, 5.0, -1.0, 4.0) == 9.0, "rate_limit(10, 5, -1, 4) == 9");
    result.check(utils::rate_limit(0.0, 5.0, -1.0, 4.0) == 4.0, "rate_limit(0, 5, -1, 4) == 4");
    result.check(utils::rate_limit(5.5, 5.0, -1.0, 4.0) == 5.5, "value inside the window is kept");
}

void test_floor_mod(TestResult& result) {
    section("Test 3: floor_mod");

    result.check(utils::floor_mod(7.0, 5.0) == 2.0, "floor_mod(7, 5) == 2");
    result.check(utils::floor_mod(-3.0, 5.0) == 2.0, "floor_mod(-3, 5) == 2");
    result.check(utils::floor_mod(-48.0, 5.0) == 2.0, "floor_mod(-48, 5) == 2");
    result.check(utils::floor_mod(10.0, 5.0) == 0.0, "floor_mod(10, 5) == 0");
}

void test_interp(TestResult& result) {
    section("Test 4: interp");

    const double xp[] = {0.0, 1.0, 2.0};
    const double fp[] = {0.0, 10.0, 30.0};

    result.check(utils::interp(-1.0, xp, fp, 3) == 0.0, "below domain holds first value");
    result.check(utils::interp(5.0, xp, fp, 3) == 30.0, "above domain holds last value");
    result.check(is_close(utils::interp(0.5, xp, fp, 3), 5.0), "interp(0.5) == 5");
    result.check(is_close(utils::interp(1.5, xp, fp, 3), 20.0), "interp(1.5) == 20");
    result.check(utils::interp(1.0, xp, fp, 3) == 10.0, "exact knot returns knot value");
}

void test_time_grid(TestResult& result) {
    section("Test 5: Model time grid");

    const auto& t = lateral::t_idxs();
    result.check(t.size() == 33, "grid has 33 samples");
    result.check(t[0] == 0.0, "grid starts at 0");
    result.check(is_close(t[32], 10.0), "grid ends at 10 s");
    result.check(is_close(t[16], 2.5), "t[16] == 2.5 s");

    bool ascending = true;
    for (size_t i = 1; i < t.size(); ++i) {
        if (!(t[i] > t[i - 1])) ascending = false;
    }
    result.check(ascending, "grid is strictly ascending");

    result.check(is_close(utils::round_to_tenth(12.36), 12.4), "round_to_tenth(12.36) == 12.4");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            Control Math Unit Tests                           ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_deadzone(result);
    test_rate_limit(result);
    test_floor_mod(result);
    test_interp(result);
    test_time_grid(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
