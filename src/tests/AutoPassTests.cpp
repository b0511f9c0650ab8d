#include <gtest/gtest.h>

#include <deque>

#include "../core/AutoPass.hpp"
#include "../core/Engine.hpp"
#include "Fixtures.hpp"

using namespace bigtwo::core;
using namespace bigtwo::test;
using RVC = error::RuleViolationCode;

namespace
{
    constexpr int64_t T0 = 1'700'000'000'000;
    constexpr auto Countdown = std::chrono::milliseconds(10000);
    RoomId const Table = "table-1";

    struct Fixture
    {
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(T0);
        Engine engine{clock};

        Fixture()
        {
            Config cfg{.seed = 9, .auto_pass_duration = Countdown};
            engine.CreateRoom(Table, cfg, MakeDefaultPredicate(), DealFrom({"3D 2S", "", "", ""}));
        }

        auto Ok(TransitionResult const& r) -> TurnState
        {
            EXPECT_TRUE(r.has_value()) << error::describe(r.error());
            return engine.GetState(Table);
        }

        // Opening trick, then seat 0 leads the unbeatable 2S.
        auto LeadUnbeatable() -> ActiveTimer
        {
            Ok(engine.Play(Table, 0, Cards("3D")));
            Ok(engine.Pass(Table, 1));
            Ok(engine.Pass(Table, 2));
            Ok(engine.Pass(Table, 3));
            TurnState const s = Ok(engine.Play(Table, 0, Cards("2S")));
            ActiveTimer const* t = ActiveOf(s.timer);
            EXPECT_NE(t, nullptr);
            return t ? *t : ActiveTimer{};
        }

        auto ExpireAfterManualPasses(int manual) -> TurnState
        {
            ActiveTimer const t = LeadUnbeatable();
            for (int i = 0; i < manual; ++i)
            {
                Ok(engine.Pass(Table, static_cast<SeatIdxT>(1 + i)));
            }
            clock->Set(t.end_timestamp_ms);
            CascadeReport const rep = engine.OnTimerExpired(Table);
            EXPECT_TRUE(rep.ran);
            EXPECT_TRUE(rep.completed);
            EXPECT_EQ(rep.passed.size(), static_cast<std::size_t>(3 - manual));
            return engine.GetState(Table);
        }
    };

    auto SameOutcome(TurnState const& a, TurnState const& b) -> void
    {
        EXPECT_EQ(a.current_turn, b.current_turn);
        EXPECT_EQ(a.last_play.has_value(), b.last_play.has_value());
        EXPECT_EQ(a.consecutive_passes, b.consecutive_passes);
        EXPECT_EQ(a.hand_counts, b.hand_counts);
        EXPECT_EQ(a.phase, b.phase);
        EXPECT_EQ(a.timer.index(), b.timer.index());
        EXPECT_EQ(a.version, b.version);
    }
}

TEST(AutoPass, ExpiryClearsTheTrickToTheExemptSeat)
{
    Fixture f;
    TurnState const s = f.ExpireAfterManualPasses(0);

    EXPECT_EQ(s.current_turn, 0);
    EXPECT_FALSE(s.last_play);
    EXPECT_EQ(s.consecutive_passes, 0);
    EXPECT_FALSE(ActiveOf(s.timer));
    EXPECT_EQ(s.hand_counts, (HandCountsT{11, 13, 13, 13}));
}

TEST(AutoPass, ManualPassesBeforeExpiryDoNotChangeTheResult)
{
    Fixture none;
    Fixture one;
    Fixture two;

    TurnState const s0 = none.ExpireAfterManualPasses(0);
    TurnState const s1 = one.ExpireAfterManualPasses(1);
    TurnState const s2 = two.ExpireAfterManualPasses(2);

    SameOutcome(s0, s1);
    SameOutcome(s0, s2);
}

TEST(AutoPass, SecondExpiryCallIsANoOp)
{
    Fixture once;
    Fixture twice;

    TurnState const a = once.ExpireAfterManualPasses(1);
    TurnState const b = twice.ExpireAfterManualPasses(1);
    CascadeReport const again = twice.engine.OnTimerExpired(Table);

    EXPECT_FALSE(again.ran);
    SameOutcome(a, twice.engine.GetState(Table));
    SameOutcome(a, b);
}

TEST(AutoPass, EarlyExpiryCallDoesNothing)
{
    Fixture f;
    ActiveTimer const t = f.LeadUnbeatable();
    f.clock->Set(t.end_timestamp_ms - 1);

    TurnState const before = f.engine.GetState(Table);
    EXPECT_FALSE(f.engine.OnTimerExpired(Table).ran);
    EXPECT_TRUE(f.engine.ExpireDueTimers().empty());
    EXPECT_EQ(f.engine.GetState(Table).version, before.version);

    f.clock->Advance(std::chrono::milliseconds(1));
    EXPECT_EQ(f.engine.ExpireDueTimers(), std::vector<RoomId>{Table});
    EXPECT_TRUE(std::holds_alternative<NoTimer>(f.engine.GetState(Table).timer));
}

TEST(AutoPass, NoTimerMeansNothingToExpire)
{
    Fixture f;
    f.Ok(f.engine.Play(Table, 0, Cards("3D")));
    f.clock->Advance(std::chrono::hours(1));
    EXPECT_FALSE(f.engine.OnTimerExpired(Table).ran);
    EXPECT_EQ(f.engine.GetState(Table).current_turn, 1);
}

TEST(AutoPass, ExemptSeatIsNeverPassed)
{
    Fixture f;
    ActiveTimer const t = f.LeadUnbeatable();
    f.clock->Set(t.end_timestamp_ms + 5000);

    CascadeReport const rep = f.engine.OnTimerExpired(Table);
    EXPECT_EQ(rep.exempt_seat, 0);
    EXPECT_EQ(rep.passed, (std::vector<SeatIdxT>{1, 2, 3}));
    EXPECT_EQ(rep.sequence_id, t.sequence_id);
}

TEST(AutoPass, ExpiryAfterTheTrickMovedOnIsANoOp)
{
    Fixture f;
    ActiveTimer const t = f.LeadUnbeatable();
    f.clock->Set(t.end_timestamp_ms);
    ASSERT_TRUE(f.engine.OnTimerExpired(Table).completed);

    // a later beatable lead carries no countdown for the old expiry to act on
    f.Ok(f.engine.Play(Table, 0, Cards("3C")));
    TurnState const s = f.engine.GetState(Table);
    EXPECT_EQ(s.current_turn, 1);
    EXPECT_FALSE(f.engine.OnTimerExpired(Table).ran);
}

// Cascade driven against scripted room behaviour.

namespace
{
    struct ScriptedRoom
    {
        TurnState state{};
        std::deque<std::optional<RVC>> script; // nullopt: apply the pass
        std::vector<SeatIdxT> calls;

        auto Live() -> TurnState { return state; }

        auto Pass(SeatIdxT seat, uint64_t) -> std::expected<TurnState, error::RuleViolation>
        {
            calls.push_back(seat);
            std::optional<RVC> step{};
            if (!script.empty())
            {
                step = script.front();
                script.pop_front();
            }
            if (step) return std::unexpected(error::Viol(*step).with_actor(seat));

            state.current_turn = static_cast<SeatIdxT>((seat + 1) % constants::NumSeats);
            if (++state.consecutive_passes == constants::PassesToClearTrick)
            {
                state.timer = NoTimer{};
                state.consecutive_passes = 0;
            }
            return state;
        }
    };

    auto RoomWithTimer(SeatIdxT exempt) -> ScriptedRoom
    {
        ScriptedRoom r{};
        r.state.current_turn = static_cast<SeatIdxT>((exempt + 1) % constants::NumSeats);
        r.state.timer = ActiveTimer{.exempt_seat = exempt, .sequence_id = 4};
        return r;
    }

    auto RunScripted(ScriptedRoom& r, uint32_t retries = 8) -> CascadeReport
    {
        ActiveTimer const t = *ActiveOf(r.state.timer);
        return RunCascade([&r] { return r.Live(); },
                          [&r](SeatIdxT seat, uint64_t seq) { return r.Pass(seat, seq); },
                          t, retries);
    }
}

TEST(Cascade, RetriesLockConflictsAgainstFreshState)
{
    ScriptedRoom r = RoomWithTimer(2);
    r.script = {RVC::RoomLockConflict, RVC::RoomLockConflict, std::nullopt};

    CascadeReport const rep = RunScripted(r);
    EXPECT_TRUE(rep.completed);
    EXPECT_EQ(rep.lock_retries, 2u);
    EXPECT_EQ(rep.passed, (std::vector<SeatIdxT>{3, 0, 1}));
}

TEST(Cascade, GivesUpAfterTheRetryBudget)
{
    ScriptedRoom r = RoomWithTimer(2);
    r.script.assign(10, RVC::RoomLockConflict);

    CascadeReport const rep = RunScripted(r, 3);
    EXPECT_FALSE(rep.completed);
    EXPECT_TRUE(rep.passed.empty());
    EXPECT_EQ(rep.lock_retries, 3u);
}

TEST(Cascade, SwallowsNotYourTurnAndContinues)
{
    ScriptedRoom r = RoomWithTimer(0);
    // someone else moves seat 1 between the read and the pass
    r.script = {RVC::NotYourTurn};

    CascadeReport const rep = RunScripted(r);
    EXPECT_EQ(rep.swallowed, 1u);
    EXPECT_TRUE(rep.completed);
    EXPECT_EQ(rep.passed, (std::vector<SeatIdxT>{1, 2, 3}));
}

TEST(Cascade, StopsWhenTheTimerWasReplaced)
{
    ScriptedRoom r = RoomWithTimer(0);
    r.script = {std::nullopt, RVC::StaleTimerSequence};

    CascadeReport const rep = RunScripted(r);
    EXPECT_EQ(rep.passed, (std::vector<SeatIdxT>{1}));
    EXPECT_EQ(r.calls.size(), 2u);
}

TEST(Cascade, StopsOnceLiveStateShowsANewTimer)
{
    ScriptedRoom r = RoomWithTimer(0);
    ActiveTimer const original = *ActiveOf(r.state.timer);
    r.state.timer = ActiveTimer{.exempt_seat = 1, .sequence_id = 5};

    CascadeReport const rep = RunCascade([&r] { return r.Live(); },
                                         [&r](SeatIdxT seat, uint64_t seq) { return r.Pass(seat, seq); },
                                         original, 8);
    EXPECT_TRUE(rep.passed.empty());
    EXPECT_TRUE(r.calls.empty());
}
