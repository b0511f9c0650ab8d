#include <gtest/gtest.h>

#include "../core/ClockSync.hpp"
#include "Fixtures.hpp"

using namespace bigtwo::core;
using namespace bigtwo::test;
using RVC = error::RuleViolationCode;

namespace
{
    auto Timer(uint64_t seq, int64_t created, int64_t duration = 10000) -> AutoPassTimer
    {
        return ActiveTimer{
            .exempt_seat = 2,
            .end_timestamp_ms = created + duration,
            .server_time_at_creation_ms = created,
            .sequence_id = seq,
            .triggering_combo = MakeCombo("2S")
        };
    }
}

TEST(ClockSync, OffsetIsMeasuredOnFirstSight)
{
    CountdownTracker tr;
    // local clock runs 3 s behind the server
    ASSERT_TRUE(tr.ObserveTimer(Timer(1, 50'000), 47'000).has_value());

    EXPECT_TRUE(tr.IsSynced());
    EXPECT_EQ(tr.OffsetMs(), 3000);
    EXPECT_EQ(tr.RemainingMs(47'000), std::optional<int64_t>{10000});
    EXPECT_EQ(tr.RemainingMs(51'000), std::optional<int64_t>{6000});
}

TEST(ClockSync, RedeliveryKeepsTheOriginalOffset)
{
    CountdownTracker tr;
    ASSERT_TRUE(tr.ObserveTimer(Timer(1, 50'000), 47'000).has_value());
    // same timer arrives again after a laggy hop
    ASSERT_TRUE(tr.ObserveTimer(Timer(1, 50'000), 47'900).has_value());

    EXPECT_EQ(tr.OffsetMs(), 3000);
    EXPECT_EQ(tr.RemainingMs(48'000), std::optional<int64_t>{9000});
}

TEST(ClockSync, RemainingNeverGoesNegative)
{
    CountdownTracker tr;
    ASSERT_TRUE(tr.ObserveTimer(Timer(1, 50'000), 50'000).has_value());
    EXPECT_EQ(tr.RemainingMs(70'000), std::optional<int64_t>{0});
}

TEST(ClockSync, OlderSequenceIsStale)
{
    CountdownTracker tr;
    ASSERT_TRUE(tr.ObserveTimer(Timer(5, 50'000), 50'000).has_value());

    auto const res = tr.ObserveTimer(Timer(4, 40'000), 50'100);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, RVC::StaleTimerSequence);
    EXPECT_EQ(res.error().sequence_id, std::optional<uint64_t>{4});
    EXPECT_EQ(tr.Active()->sequence_id, 5u);
    EXPECT_EQ(tr.LastSequence(), 5u);
}

TEST(ClockSync, ClearedTimerCannotComeBack)
{
    CountdownTracker tr;
    ASSERT_TRUE(tr.ObserveTimer(Timer(2, 50'000), 50'000).has_value());
    ASSERT_TRUE(tr.ObserveTimer(NoTimer{}, 50'500).has_value());
    EXPECT_FALSE(tr.IsSynced());
    EXPECT_FALSE(tr.RemainingMs(50'600).has_value());

    EXPECT_FALSE(tr.ObserveTimer(Timer(2, 50'000), 50'700).has_value());
    EXPECT_TRUE(tr.ObserveTimer(Timer(3, 60'000), 59'000).has_value());
    EXPECT_EQ(tr.OffsetMs(), 1000);
}

TEST(ClockSync, OlderSnapshotsAreRejected)
{
    CountdownTracker tr;
    TurnState newer{};
    newer.version = 9;
    newer.timer = Timer(3, 10'000);
    TurnState older{};
    older.version = 7;

    ASSERT_TRUE(tr.Observe(newer, 10'000).has_value());
    auto const res = tr.Observe(older, 10'100);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, RVC::StaleTimerSequence);
    // the stale snapshot did not clear the live countdown
    EXPECT_TRUE(tr.IsSynced());
}
