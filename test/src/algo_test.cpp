//
// Created by usatiynyan.
//

#include "sl/rx/algo.hpp"
#include "sl/rx/exec.hpp"

#include "recorder.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace sl::rx {
namespace {

struct test_context {
    explicit test_context(executor& an_executor, int a_multiplier = 1)
        : executor_{ an_executor }, multiplier{ a_multiplier } {}

    executor& get_executor() { return executor_; }

    executor& executor_;
    int multiplier;
};

struct sum_state {
    std::atomic<int> sum{ 0 };
    std::atomic<bool> done{ false };
};

std::exception_ptr make_error(const char* what) { return std::make_exception_ptr(std::runtime_error{ what }); }

} // namespace

TEST(algo, mapDoubles) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel() | map([](int x) { return x * 2; }, { .on_executor = &manual });
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, 3 });
    source.succeed(meta::unit{});
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 2, 4, 6 }));
    EXPECT_TRUE(record.succeeded());
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
}

TEST(algo, mapDoublesForEverySubscriber) {
    manual_executor manual;
    recorder<int> first_record;
    recorder<int> second_record;
    producer<int> source;

    const auto derived = source.get_channel() | map([](int x) { return x * 2; }, { .on_executor = &manual });
    std::ignore = derived.subscribe(first_record.handler());
    std::ignore = derived.subscribe(second_record.handler(), { .on_executor = &manual });

    source.update_all(std::vector<int>{ 1, 2, 3 });
    source.succeed(meta::unit{});
    manual.execute_all();

    for (const recorder<int>* record : { &first_record, &second_record }) {
        EXPECT_EQ(record->updates, (std::vector<int>{ 2, 4, 6 }));
        EXPECT_EQ(record->completions, 1u);
        EXPECT_TRUE(record->succeeded());
    }
}

TEST(algo, mapChangesType) {
    manual_executor manual;
    recorder<std::string, int> record;
    producer<int, int> source;

    const auto derived =
        source.get_channel() | map([](int x) { return std::to_string(x); }, { .on_executor = &manual });
    std::ignore = derived.subscribe(record.handler());

    source.update(7);
    source.succeed(1);
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<std::string>{ "7" }));
    ASSERT_TRUE(record.succeeded());
    EXPECT_EQ(record.maybe_completion->value(), 1);
}

TEST(algo, mapComposition) {
    manual_executor manual;
    recorder<int> composed_record;
    recorder<int> chained_record;
    producer<int> source;

    const auto f = [](int x) { return x + 3; };
    const auto g = [](int x) { return x * 5; };

    const auto chained = source.get_channel() | map(f, { .on_executor = &manual }) | map(g, { .on_executor = &manual });
    const auto composed =
        source.get_channel() | map([f, g](int x) { return g(f(x)); }, { .on_executor = &manual });
    std::ignore = chained.subscribe(chained_record.handler());
    std::ignore = composed.subscribe(composed_record.handler());

    for (int i = -5; i <= 5; ++i) {
        source.update(i);
    }
    source.cancel();
    manual.execute_all();

    EXPECT_EQ(chained_record.updates, composed_record.updates);
    EXPECT_EQ(chained_record.updates.size(), 11u);
    EXPECT_TRUE(chained_record.cancelled());
    EXPECT_TRUE(composed_record.cancelled());
}

TEST(algo, filter) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived =
        source.get_channel() | filter([](const int& x) { return x % 3 == 0; }, { .on_executor = &manual });
    std::ignore = derived.subscribe(record.handler());

    for (int i = 0; i < 10; ++i) {
        source.update(i);
    }
    source.succeed(meta::unit{});
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 0, 3, 6, 9 }));
    EXPECT_TRUE(record.succeeded());
}

TEST(algo, filterNeverPasses) {
    manual_executor manual;
    recorder<int, std::string> record;
    producer<int, std::string> source;

    const auto derived = source.get_channel() | filter([](int) { return false; }, { .on_executor = &manual });
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, 3 });
    source.succeed("finished");
    manual.execute_all();

    EXPECT_TRUE(record.updates.empty());
    EXPECT_EQ(record.completions, 1u);
    ASSERT_TRUE(record.succeeded());
    EXPECT_EQ(record.maybe_completion->value(), "finished");
}

TEST(algo, filterPredicateThrows) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel() | filter(
                                                    [](int x) {
                                                        if (x == 2) {
                                                            throw std::runtime_error{ "bad predicate" };
                                                        }
                                                        return true;
                                                    },
                                                    { .on_executor = &manual }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, 3 });
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 1 }));
    ASSERT_TRUE(record.failed());
    EXPECT_THROW(std::rethrow_exception(record.maybe_completion->error()), std::runtime_error);
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
    source.cancel();
}

TEST(algo, flatMapMaybe) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel() | flat_map(
                                                    [](int x) -> meta::maybe<int> {
                                                        if (x % 2 == 0) {
                                                            return tl::nullopt;
                                                        }
                                                        return x * 10;
                                                    },
                                                    { .on_executor = &manual }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, 3, 4, 5 });
    source.cancel();
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 10, 30, 50 }));
    EXPECT_TRUE(record.cancelled());
}

TEST(algo, flatMapRange) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel()
                         | flat_map([](int x) { return std::vector<int>(x, x); }, { .on_executor = &manual });
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 0, 2, 3 });
    source.succeed(meta::unit{});
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 1, 2, 2, 3, 3, 3 }));
    EXPECT_TRUE(record.succeeded());
}

TEST(algo, mapEvent) {
    manual_executor manual;
    recorder<std::string, std::string> record;
    producer<int, int> source;

    const auto derived = source.get_channel() | map_event(
                                                    [](event<int, int>&& an_event) {
                                                        using result_type = event<std::string, std::string>;
                                                        if (an_event.is_update()) {
                                                            return result_type::from_update(std::to_string(an_event.update()));
                                                        }
                                                        return result_type::from_completion(
                                                            std::move(an_event).get_completion().map([](int x) {
                                                                return std::to_string(x * 2);
                                                            })
                                                        );
                                                    },
                                                    { .on_executor = &manual }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update(1);
    source.update(2);
    source.succeed(21);
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<std::string>{ "1", "2" }));
    ASSERT_TRUE(record.succeeded());
    EXPECT_EQ(record.maybe_completion->value(), "42");
}

TEST(algo, mapEventMayComplete) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel() | map_event(
                                                    [](event<int, meta::unit>&& an_event) {
                                                        using result_type = event<int, meta::unit>;
                                                        if (an_event.is_update() && an_event.update() < 0) {
                                                            return result_type::from_completion(
                                                                completion<meta::unit>::success(meta::unit{})
                                                            );
                                                        }
                                                        return std::move(an_event);
                                                    },
                                                    { .on_executor = &manual }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, -1, 3 });
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 1, 2 }));
    EXPECT_TRUE(record.succeeded());
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
    source.cancel();
}

TEST(algo, unwrappedRoundTrip) {
    recorder<int> record;
    producer<fallible<int>> source;

    const auto derived = source.get_channel() | unwrapped();
    std::ignore = derived.subscribe(record.handler());

    for (int i = 0; i < 4; ++i) {
        source.update(fallible<int>{ i });
    }
    source.succeed(meta::unit{});

    EXPECT_EQ(record.updates, (std::vector<int>{ 0, 1, 2, 3 }));
    EXPECT_TRUE(record.succeeded());
}

TEST(algo, unwrappedStopsAtFirstFailure) {
    recorder<int> record;
    producer<fallible<int>> source;

    const auto derived = source.get_channel() | unwrapped();
    std::ignore = derived.subscribe(record.handler());

    const auto first_error = make_error("first");
    source.update(fallible<int>{ 1 });
    source.update(fallible<int>{ meta::err(first_error) });
    source.update(fallible<int>{ 2 });
    source.update(fallible<int>{ meta::err(make_error("second")) });

    EXPECT_EQ(record.updates, (std::vector<int>{ 1 }));
    EXPECT_EQ(record.completions, 1u);
    ASSERT_TRUE(record.failed());
    EXPECT_EQ(record.maybe_completion->error(), first_error);
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
    source.cancel();
}

TEST(algo, unsafelyUnwrapped) {
    recorder<int> record;
    producer<fallible<int>> source;

    const auto derived = source.get_channel() | unsafely_unwrapped();
    std::ignore = derived.subscribe(record.handler());

    source.update(fallible<int>{ 5 });
    source.cancel();

    EXPECT_EQ(record.updates, (std::vector<int>{ 5 }));
    EXPECT_TRUE(record.cancelled());
}

TEST(algoDeathTest, unsafelyUnwrappedFailure) {
    EXPECT_DEATH(
        {
            producer<fallible<int>> source;
            const auto derived = source.get_channel() | unsafely_unwrapped();
            source.update(fallible<int>{ meta::err(make_error("boom")) });
        },
        ".*"
    );
}

TEST(algo, mapThrowFailsDerived) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel() | map(
                                                    [](int x) {
                                                        if (x == 3) {
                                                            throw std::invalid_argument{ "three" };
                                                        }
                                                        return x;
                                                    },
                                                    { .on_executor = &manual }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, 3, 4 });
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 1, 2 }));
    ASSERT_TRUE(record.failed());
    EXPECT_THROW(std::rethrow_exception(record.maybe_completion->error()), std::invalid_argument);
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);

    // source itself is unaffected
    EXPECT_FALSE(source.is_completed());
    source.cancel();
}

TEST(algo, contextBound) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    auto context = arc<test_context>::make(manual, 3);

    const auto derived =
        source.get_channel() | map(context, [](test_context& a_context, int x) { return x * a_context.multiplier; });
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2 });
    // context's executor is used when none is given
    EXPECT_TRUE(record.updates.empty());
    manual.execute_all();
    EXPECT_EQ(record.updates, (std::vector<int>{ 3, 6 }));

    source.succeed(meta::unit{});
    manual.execute_all();
    EXPECT_TRUE(record.succeeded());
}

TEST(algo, contextDestroyedCancels) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    meta::maybe<arc<test_context>> context = arc<test_context>::make(manual, 2);

    const auto derived =
        source.get_channel() | map(*context, [](test_context& a_context, int x) { return x * a_context.multiplier; });
    std::ignore = derived.subscribe(record.handler());

    source.update(1);
    manual.execute_all();
    EXPECT_EQ(record.updates, (std::vector<int>{ 2 }));

    context.reset();
    source.update(2);
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 2 }));
    EXPECT_TRUE(record.cancelled());
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
    source.cancel();
}

TEST(algo, contextDestroyedWithQueuedEvents) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    meta::maybe<arc<test_context>> context = arc<test_context>::make(manual, 2);

    const auto derived =
        source.get_channel() | map(*context, [](test_context& a_context, int x) { return x * a_context.multiplier; });
    std::ignore = derived.subscribe(record.handler());

    // queued on the context's executor, which outlives the context
    source.update_all(std::vector<int>{ 1, 2, 3 });
    context.reset();
    manual.execute_all();

    EXPECT_TRUE(record.updates.empty());
    EXPECT_EQ(record.completions, 1u);
    EXPECT_TRUE(record.cancelled());
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
    source.cancel();
}

TEST(algo, contextDestroyedCancelsOnCompletion) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    meta::maybe<arc<test_context>> context = arc<test_context>::make(manual);

    const auto derived = source.get_channel() | filter(*context, [](test_context&, int) { return true; });
    std::ignore = derived.subscribe(record.handler());

    context.reset();
    source.succeed(meta::unit{});
    manual.execute_all();

    EXPECT_TRUE(record.cancelled());
}

TEST(algo, contextBoundFlatMapAndMapEvent) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    auto context = arc<test_context>::make(manual, 2);

    const auto derived =
        source.get_channel()
        | flat_map(context, [](test_context& a_context, int x) { return std::vector<int>(a_context.multiplier, x); })
        | map_event(context, [](test_context&, event<int, meta::unit>&& an_event) { return std::move(an_event); });
    std::ignore = derived.subscribe(record.handler());

    source.update(4);
    source.cancel();
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 4, 4 }));
    EXPECT_TRUE(record.cancelled());
}

TEST(algo, tokenCancels) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    cancellation_source canceller;

    const auto derived = source.get_channel() | map(
                                                    [](int x) { return x; },
                                                    {
                                                        .on_executor = &manual,
                                                        .token = canceller.token(),
                                                    }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update(1);
    manual.execute_all();
    EXPECT_EQ(source.get_channel().subscribers_count(), 1u);

    canceller.cancel();
    EXPECT_TRUE(record.cancelled());
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);

    source.update(2);
    manual.execute_all();
    EXPECT_EQ(record.updates, (std::vector<int>{ 1 }));
    EXPECT_EQ(record.completions, 1u);
    source.cancel();
}

TEST(algo, alreadyCancelledToken) {
    recorder<int> record;
    producer<int> source;
    cancellation_source canceller;
    canceller.cancel();

    const auto derived = source.get_channel() | map([](int x) { return x; }, { .token = canceller.token() });
    std::ignore = derived.subscribe(record.handler());

    EXPECT_TRUE(derived.is_completed());
    EXPECT_TRUE(record.cancelled());
    EXPECT_EQ(source.get_channel().subscribers_count(), 0u);
    source.cancel();
}

TEST(algo, makeProducer) {
    manual_executor manual;
    recorder<int, std::string> record;
    producer<int> source;

    const auto derived = make_producer<int, std::string>(
        source.get_channel(),
        { .on_executor = &manual },
        [&manual](event<int, meta::unit>&& an_event, producer<int, std::string>& a_producer, executor& origin) {
            EXPECT_EQ(&origin, static_cast<executor*>(&manual));
            if (an_event.is_update()) {
                a_producer.update(an_event.update());
                a_producer.update(-an_event.update());
            } else {
                a_producer.succeed("source completed");
            }
        }
    );
    std::ignore = derived.subscribe(record.handler());

    source.update(1);
    source.cancel();
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 1, -1 }));
    ASSERT_TRUE(record.succeeded());
    EXPECT_EQ(record.maybe_completion->value(), "source completed");
}

TEST(algo, makeProducerWithContext) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;
    auto context = arc<test_context>::make(manual, 10);

    const auto derived = make_producer<int, meta::unit>(
        source.get_channel(),
        context,
        {},
        [](test_context& a_context, event<int, meta::unit>&& an_event, producer<int>& a_producer, executor&) {
            a_producer.apply(
                an_event.is_update() ? event<int, meta::unit>::from_update(an_event.update() + a_context.multiplier)
                                     : std::move(an_event)
            );
        }
    );
    std::ignore = derived.subscribe(record.handler());

    source.update(1);
    source.cancel();
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 11 }));
    EXPECT_TRUE(record.cancelled());
}

TEST(algo, derivedBufferDropsOldest) {
    manual_executor manual;
    recorder<int> record;
    producer<int> source;

    const auto derived = source.get_channel() | map(
                                                    [](int x) { return x; },
                                                    {
                                                        .on_executor = &manual,
                                                        .buffer = buffer_size::specific(1),
                                                    }
                                                );
    std::ignore = derived.subscribe(record.handler());

    source.update_all(std::vector<int>{ 1, 2, 3 });
    source.succeed(meta::unit{});
    manual.execute_all();

    EXPECT_EQ(record.updates, (std::vector<int>{ 3 }));
    EXPECT_TRUE(record.succeeded());
}

TEST(algo, primaryExecutorPipeline) {
    constexpr int count = 1000;
    auto state = arc<sum_state>::make();
    producer<int> source;

    const auto derived = source.get_channel() | map([](int x) { return x * 2; }, { .buffer = buffer_size::unlimited() });
    // delivered on a pool thread that may still be running after the test returns
    std::ignore = derived.subscribe([state](event<int, meta::unit>&& an_event) {
        if (an_event.is_update()) {
            state->sum.fetch_add(an_event.update(), std::memory_order::relaxed);
        } else {
            state->done.store(true, std::memory_order::release);
            state->done.notify_one();
        }
    });

    for (int i = 1; i <= count; ++i) {
        source.update(i);
    }
    source.succeed(meta::unit{});
    state->done.wait(false, std::memory_order::acquire);

    EXPECT_EQ(state->sum.load(), count * (count + 1));
}

} // namespace sl::rx
