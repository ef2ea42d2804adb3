#include <cassert>
#include <iostream>
#include "railguard/policy/UndervoltagePolicy.hpp"

using railguard::policy::UndervoltagePolicy;

void testIncrementAndReset() {
    UndervoltagePolicy policy(10);
    assert(policy.consecutiveCount() == 0);
    for (unsigned i = 1; i <= 5; ++i) {
        auto d = policy.evaluate(14.0, 14.5);
        assert(d.consecutiveCount == i);
        assert(!d.tripped);
    }
    auto d = policy.evaluate(15.0, 14.5);
    assert(d.consecutiveCount == 0);
    assert(policy.consecutiveCount() == 0);
    std::cout << "[OK] policy increments and resets\n";
}

void testThresholdTieIsAcceptable() {
    UndervoltagePolicy policy(1);
    policy.evaluate(14.0, 14.5);
    auto d = policy.evaluate(14.5, 14.5);
    assert(d.consecutiveCount == 0);
    assert(!d.tripped);
    std::cout << "[OK] equal to threshold is not undervoltage\n";
}

void testTripBoundary() {
    UndervoltagePolicy policy(3);
    assert(!policy.evaluate(14.0, 14.5).tripped);
    assert(!policy.evaluate(14.0, 14.5).tripped);
    auto third = policy.evaluate(14.0, 14.5);
    assert(third.consecutiveCount == 3);
    assert(!third.tripped);
    auto fourth = policy.evaluate(14.0, 14.5);
    assert(fourth.consecutiveCount == 4);
    assert(fourth.tripped);
    // После срабатывания счётчик обнулён
    assert(policy.consecutiveCount() == 0);
    std::cout << "[OK] policy trips only when count exceeds limit\n";
}

void testInvariantOverLongRun() {
    UndervoltagePolicy policy(7);
    int trips = 0;
    for (int i = 0; i < 10000; ++i) {
        double v = (i % 97 == 0) ? 15.0 : 14.0;
        unsigned before = policy.consecutiveCount();
        assert(before <= policy.limit());
        auto d = policy.evaluate(v, 14.5);
        if (v < 14.5) {
            assert(d.consecutiveCount == before + 1);
        } else {
            assert(d.consecutiveCount == 0);
        }
        if (d.tripped) ++trips;
    }
    assert(trips > 0);
    std::cout << "[OK] policy invariant stress test\n";
}

int main() {
    testIncrementAndReset();
    testThresholdTieIsAcceptable();
    testTripBoundary();
    testInvariantOverLongRun();
    std::cout << "All UndervoltagePolicy tests passed!\n";
    return 0;
}
