#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <xblib/workers.hpp>

#include "test_helpers.hpp"

using namespace xblib;
using namespace xblib::test;

TEST(Workers, Concurrency) {
    auto const host = std::max(1u, std::thread::hardware_concurrency());
    EXPECT_EQ(Workers::concurrency(0), host);
    EXPECT_EQ(Workers::concurrency(1), 1u);
    EXPECT_EQ(Workers::concurrency(host + 100), host);
    EXPECT_EQ(Workers(1).size(), 1u);
}

TEST(Workers, MapStoresResultsByIndex) {
    auto workers = Workers(4);
    auto const results = workers.map(200, [](std::size_t index) -> std::uint64_t {
        if (index % 7 == 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        return index * 3;
    });
    ASSERT_EQ(results.size(), 200u);
    for (std::size_t i = 0; i != results.size(); ++i) {
        EXPECT_TRUE(results[i]);
        EXPECT_EQ(results[i].index, i);
        EXPECT_EQ(results[i].bytes, i * 3);
    }
}

TEST(Workers, MapCollectsFailures) {
    auto workers = Workers(3);
    auto const results = workers.map(10, [](std::size_t index) -> std::uint64_t {
        xblib_trace("job: {}", index);
        xblib_assert_errc(Errc::Integrity, index != 3 && index != 8);
        return 1;
    });
    auto failed = std::vector<std::size_t>{};
    for (auto const& result : results) {
        if (!result) {
            failed.push_back(result.index);
            EXPECT_NE(result.error.find("IntegrityError"), std::string::npos);
            EXPECT_NE(result.error.find(fmt::format("job: {}", result.index)), std::string::npos);
        }
    }
    EXPECT_EQ(failed, (std::vector<std::size_t>{3, 8}));
}

TEST(Workers, MapWithNoJobs) {
    auto workers = Workers(2);
    EXPECT_TRUE(workers.map(0, [](std::size_t) -> std::uint64_t { return 0; }).empty());
}

TEST(Workers, OrderedConsumesInIndexOrder) {
    auto workers = Workers(4);
    auto consumed = std::vector<std::size_t>{};
    workers.ordered<std::string>(
        64,
        8,
        [](std::size_t index) -> std::string {
            std::this_thread::sleep_for(std::chrono::microseconds((64 - index) * 20));
            return std::to_string(index);
        },
        [&](std::size_t index, std::string&& value) {
            EXPECT_EQ(value, std::to_string(index));
            consumed.push_back(index);
        });
    ASSERT_EQ(consumed.size(), 64u);
    for (std::size_t i = 0; i != consumed.size(); ++i) {
        EXPECT_EQ(consumed[i], i);
    }
}

TEST(Workers, OrderedKeepsWindowBounded) {
    auto workers = Workers(4);
    auto live = std::atomic<std::size_t>{};
    auto peak = std::atomic<std::size_t>{};
    workers.ordered<int>(
        40,
        3,
        [&](std::size_t) -> int {
            auto const now = ++live;
            auto expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {
            }
            return 0;
        },
        [&](std::size_t, int&&) { --live; });
    EXPECT_LE(peak.load(), 3u);
}

TEST(Workers, OrderedStopsAtFirstFailure) {
    auto workers = Workers(2);
    auto consumed = std::vector<std::size_t>{};
    auto const errc = errc_of([&] {
        workers.ordered<int>(
            100,
            4,
            [](std::size_t index) -> int {
                xblib_assert_errc(Errc::IO, index != 5);
                return (int)index;
            },
            [&](std::size_t index, int&&) { consumed.push_back(index); });
    });
    EXPECT_EQ(errc, Errc::IO);
    EXPECT_EQ(consumed, (std::vector<std::size_t>{0, 1, 2, 3, 4}));

    // The pool stays usable after a failed run.
    EXPECT_EQ(workers.map(3, [](std::size_t) -> std::uint64_t { return 1; }).size(), 3u);
}

TEST(Workers, OrderedRethrowsConsumerFailure) {
    auto workers = Workers(2);
    auto const errc = errc_of([&] {
        workers.ordered<int>(
            20,
            4,
            [](std::size_t index) -> int { return (int)index; },
            [](std::size_t index, int&&) { xblib_assert_errc(Errc::Compression, index != 2); });
    });
    EXPECT_EQ(errc, Errc::Compression);
}

TEST(Workers, OrderedWithNoJobs) {
    auto workers = Workers(2);
    auto called = false;
    workers.ordered<int>(
        0, 4, [](std::size_t) -> int { return 0; }, [&](std::size_t, int&&) { called = true; });
    EXPECT_FALSE(called);
}
