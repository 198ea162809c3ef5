#include <atomic>
#include <bbrunner/concurrent/bounded_queue.hh>
#include <bbrunner/cpu_slot_pool.hh>
#include <chrono>
#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>

using concurrent::BoundedQueue;

// NOLINTNEXTLINE
TEST(concurrent, bounded_queue_fifo) {
    BoundedQueue<int> queue{3};
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    queue.push(4);
    EXPECT_EQ(queue.pop(), 3);
    EXPECT_EQ(queue.pop(), 4);
}

// NOLINTNEXTLINE
TEST(concurrent, bounded_queue_push_blocks_while_full) {
    BoundedQueue<int> queue{1};
    queue.push(1);
    std::atomic<bool> pushed = false;
    std::thread producer{[&] {
        queue.push(2);
        pushed = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    EXPECT_FALSE(pushed);
    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(queue.pop(), 2);
}

// NOLINTNEXTLINE
TEST(concurrent, bounded_queue_many_producers_and_consumers) {
    constexpr int producers_num = 4;
    constexpr int elems_per_producer = 1000;
    BoundedQueue<int> queue{8};
    std::vector<std::thread> threads;
    for (int p = 0; p < producers_num; ++p) {
        threads.emplace_back([&queue, p] {
            for (int i = 0; i < elems_per_producer; ++i) {
                queue.push(p * elems_per_producer + i);
            }
        });
    }
    std::atomic<long long> sum = 0;
    for (int c = 0; c < producers_num; ++c) {
        threads.emplace_back([&] {
            for (int i = 0; i < elems_per_producer; ++i) {
                sum += queue.pop();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    constexpr long long n = producers_num * elems_per_producer;
    EXPECT_EQ(sum, n * (n - 1) / 2);
}

// NOLINTNEXTLINE
TEST(concurrent, cpu_slot_pool_leases_distinct_slots) {
    bbrunner::CpuSlotPool pool{2};
    std::set<uint32_t> slots;
    {
        auto a = pool.acquire();
        auto b = pool.acquire();
        slots = {a.slot(), b.slot()};
        EXPECT_EQ(slots, (std::set<uint32_t>{0, 1}));

        std::atomic<bool> acquired = false;
        std::thread waiter{[&] {
            auto c = pool.acquire();
            acquired = true;
            EXPECT_EQ(c.slot(), 0);
        }};
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        EXPECT_FALSE(acquired);
        {
            auto moved = std::move(a); // returned once, by the moved-to lease
        }
        waiter.join();
        EXPECT_TRUE(acquired);
    }
    auto a = pool.acquire();
    auto b = pool.acquire();
    EXPECT_NE(a.slot(), b.slot());
}
