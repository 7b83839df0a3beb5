// =================================================================
// tests/BoundedQueueTest.cpp
// =================================================================
// Unit tests for the BoundedQueue used between walker and readers.

#include "Repolens/BoundedQueue.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class BoundedQueueTest {
public:
    void testFifoOrder() {
        std::cout << "Testing FIFO order..." << std::endl;

        Repolens::BoundedQueue<int> queue(4);
        assert(queue.capacity() == 4);
        assert(queue.push(1));
        assert(queue.push(2));
        assert(queue.push(3));
        assert(queue.size() == 3);

        assert(*queue.pop() == 1);
        assert(*queue.pop() == 2);
        assert(*queue.pop() == 3);
        assert(queue.size() == 0);

        std::cout << "✓ FIFO order test passed" << std::endl;
    }

    void testZeroCapacityRejected() {
        std::cout << "Testing zero capacity..." << std::endl;

        bool threw = false;
        try {
            Repolens::BoundedQueue<int> queue(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Capacity 0 must be rejected");

        std::cout << "✓ Zero capacity test passed" << std::endl;
    }

    void testPushBlocksWhileFull() {
        std::cout << "Testing push blocking at capacity..." << std::endl;

        Repolens::BoundedQueue<int> queue(1);
        assert(queue.push(1));

        std::atomic<bool> second_pushed{false};
        std::thread producer([&]() {
            queue.push(2);
            second_pushed = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(!second_pushed && "Producer must wait while the queue is full");
        assert(queue.size() == 1);

        assert(*queue.pop() == 1);
        producer.join();
        assert(second_pushed);
        assert(*queue.pop() == 2);

        std::cout << "✓ Push blocking test passed" << std::endl;
    }

    void testCloseSemantics() {
        std::cout << "Testing close semantics..." << std::endl;

        Repolens::BoundedQueue<int> queue(3);
        queue.push(10);
        queue.push(20);
        queue.close();

        assert(!queue.push(30) && "Push after close fails");
        assert(queue.size() == 2);

        // Items queued before close are still delivered
        assert(*queue.pop() == 10);
        assert(*queue.pop() == 20);
        assert(!queue.pop().has_value() && "Closed and empty yields nullopt");
        assert(!queue.pop().has_value());

        queue.close(); // idempotent
        assert(!queue.push(40));

        std::cout << "✓ Close semantics test passed" << std::endl;
    }

    void testCloseWakesWaiters() {
        std::cout << "Testing close wakes blocked threads..." << std::endl;

        Repolens::BoundedQueue<int> empty_queue(1);
        std::atomic<bool> consumer_done{false};
        std::thread consumer([&]() {
            auto item = empty_queue.pop();
            assert(!item.has_value());
            consumer_done = true;
        });

        Repolens::BoundedQueue<int> full_queue(1);
        full_queue.push(1);
        std::atomic<bool> producer_result{true};
        std::thread producer([&]() {
            producer_result = full_queue.push(2);
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        empty_queue.close();
        full_queue.close();
        consumer.join();
        producer.join();

        assert(consumer_done);
        assert(!producer_result && "Blocked push returns false when the queue closes");

        std::cout << "✓ Close wakes waiters test passed" << std::endl;
    }

    void testMultipleProducersAndConsumers() {
        std::cout << "Testing multiple producers and consumers..." << std::endl;

        const int producers = 4;
        const int consumers = 3;
        const int per_producer = 500;

        Repolens::BoundedQueue<int> queue(8);
        std::vector<std::thread> producer_threads;
        for (int p = 0; p < producers; ++p) {
            producer_threads.emplace_back([&queue, p, per_producer]() {
                for (int i = 0; i < per_producer; ++i) {
                    queue.push(p * per_producer + i);
                }
            });
        }

        std::mutex seen_mutex;
        std::set<int> seen;
        std::atomic<int> popped{0};
        std::vector<std::thread> consumer_threads;
        for (int c = 0; c < consumers; ++c) {
            consumer_threads.emplace_back([&]() {
                while (auto item = queue.pop()) {
                    std::lock_guard<std::mutex> lock(seen_mutex);
                    seen.insert(*item);
                    ++popped;
                }
            });
        }

        for (auto& t : producer_threads) {
            t.join();
        }
        queue.close();
        for (auto& t : consumer_threads) {
            t.join();
        }

        assert(popped == producers * per_producer && "Every item is delivered once");
        assert(seen.size() == static_cast<size_t>(producers * per_producer) && "No duplicates");

        std::cout << "✓ Multiple producers and consumers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running BoundedQueue unit tests..." << std::endl;

        testFifoOrder();
        testZeroCapacityRejected();
        testPushBlocksWhileFull();
        testCloseSemantics();
        testCloseWakesWaiters();
        testMultipleProducersAndConsumers();

        std::cout << "All BoundedQueue tests passed!" << std::endl;
    }
};

int main() {
    try {
        BoundedQueueTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All BoundedQueue component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
