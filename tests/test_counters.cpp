#include "counters.hpp"
#include "database.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <numeric>
#include <thread>
#include <vector>

namespace {

models::BankProfile narrowProfile() {
    auto profile = fixtures::santanderProfile();
    profile.minIdentifier = 1000000;
    profile.maxIdentifier = 1000002;
    profile.currentIdentifier = 1000000;
    return profile;
}

models::ProfileKey keyOf(const models::BankProfile &profile) {
    return {profile.owner, profile.bankCode};
}

}

TEST(identifier_allocator, exhausts_bounded_range)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    fixtures::seed(db, profile);

    auto connection = db.connect(true);
    counters::IdentifierAllocator allocator(connection.get());

    EXPECT_EQ(allocator.allocate(profile).value(), 1000000);
    EXPECT_EQ(allocator.allocate(profile).value(), 1000001);
    EXPECT_EQ(allocator.allocate(profile).value(), 1000002);
    EXPECT_EQ(allocator.allocate(profile).error(), UNEXPECTED_CODE::RANGE_EXHAUSTED);
    EXPECT_EQ(allocator.allocate(profile).error(), UNEXPECTED_CODE::RANGE_EXHAUSTED);

    EXPECT_FALSE(database::commit(connection.get()).has_value());

    auto reader = db.connect(false);
    EXPECT_EQ(counters::IdentifierAllocator(reader.get()).peek(keyOf(profile)).value(), 1000003);
}

TEST(identifier_allocator, peek_does_not_advance)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    fixtures::seed(db, profile);

    auto connection = db.connect(true);
    counters::IdentifierAllocator allocator(connection.get());

    EXPECT_EQ(allocator.peek(keyOf(profile)).value(), 1000000);
    EXPECT_EQ(allocator.peek(keyOf(profile)).value(), 1000000);
    EXPECT_EQ(allocator.allocate(profile).value(), 1000000);
    EXPECT_EQ(allocator.peek(keyOf(profile)).value(), 1000001);
    EXPECT_EQ(profile.currentIdentifier, 1000001);
}

TEST(identifier_allocator, release_without_commit_rolls_back)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    fixtures::seed(db, profile);

    {
        auto connection = db.connect(true);
        counters::IdentifierAllocator allocator(connection.get());
        EXPECT_EQ(allocator.allocate(profile).value(), 1000000);
        EXPECT_EQ(allocator.allocate(profile).value(), 1000001);
    }

    auto connection = db.connect(true);
    counters::IdentifierAllocator allocator(connection.get());
    EXPECT_EQ(allocator.allocate(profile).value(), 1000000);
}

TEST(identifier_allocator, starts_at_range_minimum)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    profile.currentIdentifier = 1;
    fixtures::seed(db, profile);

    auto connection = db.connect(true);
    counters::IdentifierAllocator allocator(connection.get());

    EXPECT_EQ(allocator.peek(keyOf(profile)).value(), 1000000);
    EXPECT_EQ(allocator.allocate(profile).value(), 1000000);
}

TEST(identifier_allocator, needs_transaction_and_profile)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    fixtures::seed(db, profile);

    auto plain = db.connect(false);
    EXPECT_EQ(counters::IdentifierAllocator(plain.get()).allocate(profile).error(),
              UNEXPECTED_CODE::UNKNOWN);
    plain.reset();

    auto connection = db.connect(true);
    auto missing = profile;
    missing.bankCode = "274";
    EXPECT_EQ(counters::IdentifierAllocator(connection.get()).allocate(missing).error(),
              UNEXPECTED_CODE::NOT_FOUND);
}

TEST(identifier_allocator, concurrent_allocations_are_distinct)
{
    fixtures::TemporaryDatabase db;
    auto profile = fixtures::santanderProfile();
    fixtures::seed(db, profile);

    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 25;

    std::mutex lock;
    std::vector<std::int64_t> values;
    int failures = 0;

    std::vector<std::thread> workers;

    for(int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&]() {
            for(int i = 0; i < PER_THREAD; ++i) {
                auto connection = db.connect(true);
                auto mine = profile;

                auto value = counters::IdentifierAllocator(connection.get()).allocate(mine);
                auto committed = !database::commit(connection.get()).has_value();

                std::lock_guard<std::mutex> guard(lock);
                if(value.has_value() && committed) {
                    values.push_back(*value);
                } else {
                    ++failures;
                }
            }
        });
    }

    for(auto &worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures, 0);
    ASSERT_EQ(values.size(), static_cast<std::size_t>(THREADS * PER_THREAD));

    std::sort(values.begin(), values.end());

    std::vector<std::int64_t> expected(values.size());
    std::iota(expected.begin(), expected.end(), profile.currentIdentifier);

    EXPECT_EQ(values, expected);
}

TEST(sequence_tracker, independent_from_identifiers)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    fixtures::seed(db, profile);

    auto connection = db.connect(true);
    counters::SequenceTracker tracker(connection.get());
    counters::IdentifierAllocator allocator(connection.get());

    EXPECT_EQ(tracker.allocate(profile).value(), 1);
    EXPECT_EQ(tracker.allocate(profile).value(), 2);
    EXPECT_EQ(allocator.peek(keyOf(profile)).value(), 1000000);
    EXPECT_EQ(tracker.peek(keyOf(profile)).value(), 3);
}

TEST(sequence_tracker, concurrent_allocations_are_distinct)
{
    fixtures::TemporaryDatabase db;
    auto profile = fixtures::santanderProfile();
    fixtures::seed(db, profile);

    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 10;

    std::mutex lock;
    std::vector<std::int64_t> values;
    int failures = 0;

    std::vector<std::thread> workers;

    for(int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&]() {
            for(int i = 0; i < PER_THREAD; ++i) {
                auto connection = db.connect(true);
                auto mine = profile;

                auto value = counters::SequenceTracker(connection.get()).allocate(mine);
                auto committed = !database::commit(connection.get()).has_value();

                std::lock_guard<std::mutex> guard(lock);
                if(value.has_value() && committed) {
                    values.push_back(*value);
                } else {
                    ++failures;
                }
            }
        });
    }

    for(auto &worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures, 0);
    ASSERT_EQ(values.size(), static_cast<std::size_t>(THREADS * PER_THREAD));

    std::sort(values.begin(), values.end());

    std::vector<std::int64_t> expected(values.size());
    std::iota(expected.begin(), expected.end(), 1);

    EXPECT_EQ(values, expected);

    auto reader = db.connect(false);
    EXPECT_EQ(counters::SequenceTracker(reader.get()).peek(keyOf(profile)).value(),
              THREADS * PER_THREAD + 1);
    EXPECT_EQ(counters::IdentifierAllocator(reader.get()).peek(keyOf(profile)).value(),
              profile.currentIdentifier);
}

TEST(sequence_tracker, bounded_by_max_sequence)
{
    fixtures::TemporaryDatabase db;
    auto profile = narrowProfile();
    profile.currentSequence = 9999;
    fixtures::seed(db, profile);

    auto connection = db.connect(true);
    counters::SequenceTracker tracker(connection.get());

    EXPECT_EQ(tracker.allocate(profile).value(), 9999);
    EXPECT_EQ(tracker.allocate(profile).error(), UNEXPECTED_CODE::RANGE_EXHAUSTED);
    EXPECT_EQ(tracker.peek(keyOf(profile)).value(), 10000);
}

TEST(sequence_tracker, filename)
{
    EXPECT_EQ(counters::SequenceTracker::filename(7, fixtures::date(2026, 11, 2)).value(),
              "CB02110007.REM");
    EXPECT_EQ(counters::SequenceTracker::filename(1234, fixtures::date(2026, 1, 31)).value(),
              "CB31011234.REM");
    EXPECT_EQ(counters::SequenceTracker::filename(10000, fixtures::date(2026, 1, 31)).error(),
              UNEXPECTED_CODE::FIELD_OVERFLOW);
}
