/**
 * Format Tests
 *
 * Progress line counts, rates and durations.
 */

#include "../src/core/format.hpp"
#include <cassert>
#include <iostream>

using namespace seedhound;

void test_counts() {
    assert(format_count(0) == "0");
    assert(format_count(8) == "8");
    assert(format_count(999) == "999");
    assert(format_count(1000) == "1.0K");
    assert(format_count(1500) == "1.5K");
    assert(format_count(2500000) == "2.5M");
    assert(format_count(3000000000ULL) == "3.0G");

    std::cout << "[PASS] Counts below 1000 print whole\n";
}

void test_rates() {
    assert(format_rate(0.0) == "0.0/s");
    assert(format_rate(12.0) == "12.0/s");
    assert(format_rate(4500.0) == "4.5K/s");
    assert(format_rate(7.5e6) == "7.5M/s");

    std::cout << "[PASS] Rates\n";
}

void test_durations() {
    assert(format_duration(-1.0) == "unknown");
    assert(format_duration(0.0) == "00:00:00");
    assert(format_duration(59.9) == "00:00:59");
    assert(format_duration(3725.0) == "01:02:05");
    assert(format_duration(90061.0) == "1d 01:01:01");
    assert(format_duration(1e12) == "centuries");

    std::cout << "[PASS] Durations\n";
}

int main() {
    std::cout << "=== Format Tests ===\n\n";

    test_counts();
    test_rates();
    test_durations();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
