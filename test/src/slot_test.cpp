//
// Created by usatiynyan.
//

#include "sl/rx/slot.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <vector>

namespace sl::rx {

template <typename BackendT>
struct slotBackend : ::testing::Test {};

using slot_backends = ::testing::Types<slot_backend::lock_free, slot_backend::mutex, slot_backend::spinlock, slot_backend::semaphore>;
TYPED_TEST_SUITE(slotBackend, slot_backends);

namespace {

slot_head<int> increment(const slot_head<int>& head) { return arc<int>::make(head.has_value() ? **head + 1 : 1); }

} // namespace

TYPED_TEST(slotBackend, emptyByDefault) {
    atomic_slot<int, TypeParam> slot;
    EXPECT_FALSE(slot.head().has_value());
}

TYPED_TEST(slotBackend, initialHead) {
    atomic_slot<int, TypeParam> slot{ arc<int>::make(42) };
    const auto head = slot.head();
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(**head, 42);
}

TYPED_TEST(slotBackend, updateReturnsOldAndNew) {
    atomic_slot<int, TypeParam> slot;

    const auto first = slot.update(increment);
    EXPECT_FALSE(first.old_head.has_value());
    ASSERT_TRUE(first.new_head.has_value());
    EXPECT_EQ(**first.new_head, 1);

    const auto second = slot.update(increment);
    ASSERT_TRUE(second.old_head.has_value());
    ASSERT_TRUE(second.new_head.has_value());
    EXPECT_EQ(**second.old_head, 1);
    EXPECT_EQ(**second.new_head, 2);
    EXPECT_TRUE(first.new_head.value() == second.old_head.value());
}

TYPED_TEST(slotBackend, throwingTransformKeepsHead) {
    const auto value = arc<int>::make(7);
    atomic_slot<int, TypeParam> slot{ value };

    const auto throwing = [](const slot_head<int>&) -> slot_head<int> { throw std::runtime_error{ "transform" }; };
    EXPECT_THROW(std::ignore = slot.update(throwing), std::runtime_error);

    const auto head = slot.head();
    ASSERT_TRUE(head.has_value());
    EXPECT_TRUE(head.value() == value);

    // nothing but the test and the slot reference the value after a failed update
    EXPECT_EQ(value.use_count(), 3u);
    std::ignore = slot.reset();
    EXPECT_EQ(value.use_count(), 2u);

    std::ignore = slot.update(increment);
    ASSERT_TRUE(slot.head().has_value());
    EXPECT_EQ(**slot.head(), 1);
}

TYPED_TEST(slotBackend, updateToEmpty) {
    atomic_slot<int, TypeParam> slot{ arc<int>::make(1) };
    const auto result = slot.update([](const slot_head<int>&) -> slot_head<int> { return tl::nullopt; });
    ASSERT_TRUE(result.old_head.has_value());
    EXPECT_EQ(**result.old_head, 1);
    EXPECT_FALSE(result.new_head.has_value());
    EXPECT_FALSE(slot.head().has_value());
}

TYPED_TEST(slotBackend, exchangeAndReset) {
    atomic_slot<int, TypeParam> slot{ arc<int>::make(1) };

    const auto exchanged = slot.exchange(arc<int>::make(2));
    EXPECT_EQ(**exchanged.old_head, 1);
    EXPECT_EQ(**slot.head(), 2);

    const auto old_head = slot.reset();
    ASSERT_TRUE(old_head.has_value());
    EXPECT_EQ(**old_head, 2);
    EXPECT_FALSE(slot.head().has_value());
}

TYPED_TEST(slotBackend, headOutlivesReplacement) {
    atomic_slot<int, TypeParam> slot{ arc<int>::make(1) };
    const auto head = slot.head();
    std::ignore = slot.exchange(arc<int>::make(2));
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(**head, 1);
    EXPECT_EQ(head->use_count(), 1u);
}

TYPED_TEST(slotBackend, makeAtomicSlot) {
    auto slot = make_atomic_slot<int, TypeParam>(arc<int>::make(7));
    EXPECT_EQ(**slot.head(), 7);
}

TYPED_TEST(slotBackend, contendedIncrementsAreLinearizable) {
    constexpr int tcount = 8;
    constexpr int updates_per_thread = 2000;

    atomic_slot<int, TypeParam> slot;
    std::vector<std::vector<int>> observed(tcount);

    std::vector<std::thread> threads;
    threads.reserve(tcount);
    for (int t = 0; t < tcount; ++t) {
        threads.emplace_back([&slot, &local = observed[t]] {
            local.reserve(updates_per_thread);
            for (int i = 0; i < updates_per_thread; ++i) {
                const auto result = slot.update(increment);
                const int old_value = result.old_head.has_value() ? **result.old_head : 0;
                ASSERT_TRUE(result.new_head.has_value());
                ASSERT_EQ(**result.new_head, old_value + 1);
                local.push_back(old_value);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(**slot.head(), tcount * updates_per_thread);

    // every old head was observed by exactly one update
    std::vector<int> all_observed;
    for (const auto& local : observed) {
        all_observed.insert(all_observed.end(), local.begin(), local.end());
    }
    std::sort(all_observed.begin(), all_observed.end());
    std::vector<int> expected(tcount * updates_per_thread);
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(all_observed, expected);
}

TYPED_TEST(slotBackend, readersSeeMonotonicHeads) {
    constexpr int readers = 4;
    constexpr int updates = 20000;

    atomic_slot<int, TypeParam> slot{ arc<int>::make(0) };
    std::atomic<bool> done{ false };

    std::vector<std::thread> threads;
    for (int t = 0; t < readers; ++t) {
        threads.emplace_back([&slot, &done] {
            int last = 0;
            while (!done.load(std::memory_order::acquire)) {
                const auto head = slot.head();
                ASSERT_TRUE(head.has_value());
                ASSERT_GE(**head, last);
                last = **head;
            }
        });
    }
    for (int i = 0; i < updates; ++i) {
        std::ignore = slot.update(increment);
    }
    done.store(true, std::memory_order::release);
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(**slot.head(), updates);
}

TEST(slot, persistentListRemoveKeepsOrder) {
    persistent_list<int> list;
    for (int i = 5; i > 0; --i) {
        list = push_front(list, i);
    }

    const auto removed = remove_if(list, [](int x) { return x % 2 == 0; });

    std::vector<int> remaining;
    for_each(removed, [&remaining](int x) { remaining.push_back(x); });
    EXPECT_EQ(remaining, (std::vector<int>{ 1, 3, 5 }));

    std::vector<int> original;
    for_each(list, [&original](int x) { original.push_back(x); });
    EXPECT_EQ(original, (std::vector<int>{ 1, 2, 3, 4, 5 }));
}

TEST(slot, persistentListRemoveNothingSharesList) {
    persistent_list<int> list = push_front(push_front(persistent_list<int>{}, 2), 1);
    const auto same = remove_if(list, [](int) { return false; });
    ASSERT_TRUE(same.has_value());
    EXPECT_TRUE(same.value() == list.value());
}

TEST(slot, subscriberListUnderContention) {
    constexpr int tcount = 4;
    constexpr int per_thread = 500;

    atomic_slot<persistent_list_node<int>> slot;
    std::vector<std::thread> threads;
    for (int t = 0; t < tcount; ++t) {
        threads.emplace_back([&slot, t] {
            for (int i = 0; i < per_thread; ++i) {
                const int value = t * per_thread + i;
                std::ignore = slot.update([value](const persistent_list<int>& list) { return push_front(list, value); });
                if (i % 2 == 1) {
                    std::ignore = slot.update([value](const persistent_list<int>& list) {
                        return remove_if(list, [value](int x) { return x == value; });
                    });
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<int> remaining;
    for_each(slot.head(), [&remaining](int x) { remaining.push_back(x); });
    std::sort(remaining.begin(), remaining.end());

    std::vector<int> expected;
    for (int value = 0; value < tcount * per_thread; value += 2) {
        expected.push_back(value);
    }
    EXPECT_EQ(remaining, expected);
}

} // namespace sl::rx
