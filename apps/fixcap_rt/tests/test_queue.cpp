#include <fixcap/core/queue.hpp>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;

int main() {
    std::cout << "=== Testing Queue ===" << std::endl;

    // Test 1: FIFO order
    std::cout << "\n[Test 1] FIFO order..." << std::endl;
    {
        fixcap::core::Queue<int> q;
        q.push(1);
        q.push(2);
        q.push(3);
        assert(q.size() == 3);
        assert(q.try_pop() == 1);
        assert(q.try_pop() == 2);
        assert(q.try_pop() == 3);
        assert(!q.try_pop().has_value() && "Empty queue should yield nothing");
        assert(q.empty());
    }
    std::cout << "  ✓ Elements come out in push order" << std::endl;

    // Test 2: Bounded queue drops the oldest element
    std::cout << "\n[Test 2] Bounded queue..." << std::endl;
    {
        fixcap::core::Queue<int> q(2);
        q.push(1);
        q.push(2);
        q.push(3);
        assert(q.size() == 2);
        assert(q.dropped() == 1);
        assert(q.try_pop() == 2 && "Oldest element should have been dropped");
        assert(q.try_pop() == 3);
    }
    std::cout << "  ✓ Full queue keeps the newest elements" << std::endl;

    // Test 3: clear_and runs under the lock after the queue is emptied
    std::cout << "\n[Test 3] clear_and..." << std::endl;
    {
        fixcap::core::Queue<int> q;
        q.push(1);
        q.push(2);
        size_t seen = 99;
        q.clear_and([&] { seen = 0; });
        assert(seen == 0);
        assert(q.empty());
        q.push(3);
        assert(q.try_pop() == 3);
    }
    std::cout << "  ✓ Queue emptied and callback ran" << std::endl;

    // Test 4: wait_and_pop_for times out on an empty queue
    std::cout << "\n[Test 4] wait_and_pop_for timeout..." << std::endl;
    {
        fixcap::core::Queue<int> q;
        int value = 0;
        auto start = std::chrono::steady_clock::now();
        assert(!q.wait_and_pop_for(value, 20ms));
        assert(std::chrono::steady_clock::now() - start >= 20ms);
    }
    std::cout << "  ✓ Timed out without a value" << std::endl;

    // Test 5: wait_and_pop_for wakes on a push from another thread
    std::cout << "\n[Test 5] Cross-thread wake up..." << std::endl;
    {
        fixcap::core::Queue<int> q;
        std::jthread producer([&q] {
            std::this_thread::sleep_for(10ms);
            q.push(42);
        });
        int value = 0;
        assert(q.wait_and_pop_for(value, 2s));
        assert(value == 42);
    }
    std::cout << "  ✓ Consumer received the value" << std::endl;

    // Test 6: wait_and_pop returns false once stop is requested
    std::cout << "\n[Test 6] Stop token..." << std::endl;
    {
        fixcap::core::Queue<int> q;
        std::stop_source source;
        std::jthread stopper([&source] {
            std::this_thread::sleep_for(10ms);
            source.request_stop();
        });
        int value = 0;
        assert(!q.wait_and_pop(value, source.get_token()));
    }
    std::cout << "  ✓ Waiter released by stop request" << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
