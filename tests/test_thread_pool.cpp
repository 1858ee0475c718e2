/**
 * Thread Pool Tests
 *
 * parallel_for coverage, concurrent callers and exception propagation.
 */

#include "../src/core/thread_pool.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace seedhound;

void test_parallel_for_covers_range() {
    ThreadPool pool(4);
    assert(pool.size() == 4);

    std::vector<int> hits(1000, 0);
    pool.parallel_for(hits.size(), [&hits](size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) hits[i]++;
    });
    for (int h : hits) assert(h == 1);

    // Fewer items than workers
    std::vector<int> few(3, 0);
    pool.parallel_for(few.size(), [&few](size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) few[i] = static_cast<int>(i) + 1;
    });
    assert(few[0] == 1 && few[1] == 2 && few[2] == 3);

    pool.parallel_for(0, [](size_t, size_t) { assert(false); });

    std::cout << "[PASS] parallel_for covers the range once\n";
}

void test_concurrent_callers() {
    ThreadPool pool(3);
    std::atomic<size_t> total{0};

    std::vector<std::thread> callers;
    for (int c = 0; c < 4; c++) {
        callers.emplace_back([&pool, &total] {
            for (int round = 0; round < 20; round++) {
                pool.parallel_for(100, [&total](size_t begin, size_t end) {
                    total += end - begin;
                });
            }
        });
    }
    for (auto& t : callers) t.join();
    assert(total == 4 * 20 * 100);

    std::cout << "[PASS] Concurrent callers share the pool\n";
}

void test_exception_propagates() {
    ThreadPool pool(2);
    bool threw = false;
    try {
        pool.parallel_for(10, [](size_t begin, size_t) {
            if (begin == 0) throw std::runtime_error("chunk failed");
        });
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "chunk failed";
    }
    assert(threw);

    // The pool is still usable afterwards
    std::atomic<int> calls{0};
    pool.parallel_for(2, [&calls](size_t, size_t) { calls++; });
    assert(calls == 2);

    std::cout << "[PASS] Exceptions reach the caller\n";
}

int main() {
    std::cout << "=== Thread Pool Tests ===\n\n";

    test_parallel_for_covers_range();
    test_concurrent_callers();
    test_exception_propagates();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
