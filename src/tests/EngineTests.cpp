#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <thread>

#include "../core/Engine.hpp"
#include "../core/MoveGen.hpp"
#include "Fixtures.hpp"

using namespace bigtwo::core;
using namespace bigtwo::test;
using RVC = error::RuleViolationCode;

namespace
{
    constexpr int64_t T0 = 1'700'000'000'000;

    auto MakeEngine() -> Engine
    {
        return Engine(std::make_shared<ManualClock>(T0));
    }

    // Parks the first play inside the room's transition until released.
    class BlockingPredicate final : public UnbeatablePredicate
    {
    public:
        BlockingPredicate(std::promise<void>& entered, std::shared_future<void> release)
            : entered_{entered}, release_{std::move(release)}
        {
        }

        auto IsUnbeatable(Combo const&, UnbeatableContext const&) const -> bool override
        {
            if (!signalled_.exchange(true))
            {
                entered_.set_value();
                release_.wait();
            }
            return false;
        }

        auto Name() const -> std::string_view override { return "blocking"; }

    private:
        std::promise<void>& entered_;
        std::shared_future<void> release_;
        mutable std::atomic<bool> signalled_{false};
    };
}

TEST(Engine, RoomsAreKeyedById)
{
    Engine engine = MakeEngine();
    engine.CreateRoom("a", Config{.seed = 1});
    engine.CreateRoom("b", Config{.seed = 2});

    EXPECT_TRUE(engine.HasRoom("a"));
    EXPECT_EQ(engine.RoomIds().size(), 2u);
    EXPECT_THROW(engine.CreateRoom("a", Config{.seed = 3}), error::StateError);

    EXPECT_TRUE(engine.RemoveRoom("a"));
    EXPECT_FALSE(engine.RemoveRoom("a"));
    EXPECT_THROW((void)engine.GetState("a"), error::StateError);
    EXPECT_THROW((void)engine.Pass("a", 0), error::StateError);
}

TEST(Engine, RoomsDoNotShareState)
{
    Engine engine = MakeEngine();
    engine.CreateRoom("a", Config{.seed = 1}, MakeDefaultPredicate(), DealFrom({"3D", "", "", ""}));
    engine.CreateRoom("b", Config{.seed = 1}, MakeDefaultPredicate(), DealFrom({"3D", "", "", ""}));

    ASSERT_TRUE(engine.Play("a", 0, Cards("3D")).has_value());
    EXPECT_EQ(engine.GetState("a").current_turn, 1);
    EXPECT_EQ(engine.GetState("b").current_turn, 0);
    EXPECT_EQ(engine.GetState("b").version, 0u);
}

TEST(Engine, ViewsShowOnlyTheOwnHand)
{
    Engine engine = MakeEngine();
    DealT const deal = DealFrom({"3D 2S", "", "", ""});
    engine.CreateRoom("t", Config{.seed = 1}, MakeDefaultPredicate(), deal);
    ASSERT_TRUE(engine.Play("t", 0, Cards("3D")).has_value());

    for (SeatIdxT seat{}; seat < constants::NumSeats; ++seat)
    {
        std::shared_ptr<SeatView const> const v = engine.ViewFor("t", seat);
        EXPECT_EQ(v->seat, seat);
        EXPECT_EQ(v->my_hand.size(), v->state.hand_counts[seat]);
        EXPECT_EQ(v->played, Cards("3D"));
    }
    EXPECT_EQ(engine.ViewFor("t", 1)->my_hand, deal[1]);
    EXPECT_EQ(engine.ViewFor("t", 0)->state.hand_counts, (HandCountsT{12, 13, 13, 13}));
}

TEST(Engine, ViolationsComeBackAsValues)
{
    Engine engine = MakeEngine();
    engine.CreateRoom("t", Config{.seed = 1}, MakeDefaultPredicate(), DealFrom({"3D 4D", "", "", ""}));

    auto const early = engine.Pass("t", 2);
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, RVC::NotYourTurn);

    auto const lead = engine.Pass("t", 0);
    ASSERT_FALSE(lead.has_value());
    EXPECT_EQ(lead.error().code, RVC::CannotPassWhileLeading);

    auto const opening = engine.Play("t", 0, Cards("4D"));
    ASSERT_FALSE(opening.has_value());
    EXPECT_EQ(opening.error().code, RVC::MissingRequiredCard);
    EXPECT_EQ(engine.GetState("t").version, 0u);
}

TEST(Engine, HistoryRecordsFinishedMatches)
{
    Engine engine = MakeEngine();
    DealT deal{};
    deal[0] = Cards("3D");
    deal[1] = Cards("4D 5D");
    deal[2] = Cards("6D 7D 8D");
    deal[3] = Cards("9D 10D 10C 10H 10S JD");
    engine.CreateRoom("t", Config{.seed = 1}, MakeDefaultPredicate(), deal);

    EXPECT_TRUE(engine.History("t").empty());
    ASSERT_TRUE(engine.Play("t", 0, Cards("3D")).has_value());

    std::vector<MatchRecord> const h = engine.History("t");
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h.front().score, (MatchScore{0, 2, 3, 12}));
    EXPECT_EQ(engine.GetState("t").totals, (ScoreArrayT{0, 2, 3, 12}));
}

TEST(Engine, BusyRoomRejectsRatherThanWaits)
{
    Engine engine = MakeEngine();
    std::promise<void> entered;
    std::promise<void> release;
    engine.CreateRoom("t", Config{.seed = 1},
                      std::make_unique<BlockingPredicate>(entered, release.get_future().share()),
                      DealFrom({"3D", "", "", ""}));

    TransitionResult play = std::unexpected(error::Viol(RVC::GameNotInProgress));
    std::thread player([&]
    {
        play = engine.Play("t", 0, Cards("3D"));
    });

    entered.get_future().wait();
    TransitionResult const pass = engine.Pass("t", 1);
    release.set_value();
    player.join();

    ASSERT_FALSE(pass.has_value());
    EXPECT_EQ(pass.error().code, RVC::RoomLockConflict);
    ASSERT_TRUE(play.has_value());
    EXPECT_EQ(engine.GetState("t").current_turn, 1);
    EXPECT_EQ(engine.GetState("t").consecutive_passes, 0);
}

TEST(Engine, LaterMatchesOpenWithoutTheThreeOfDiamonds)
{
    Engine engine = MakeEngine();
    DealT deal{};
    deal[0] = Cards("3D");
    deal[1] = Cards("4D 5D");
    deal[2] = Cards("6D 7D 8D");
    deal[3] = Cards("9D 10D 10C 10H 10S JD");
    engine.CreateRoom("t", Config{.seed = 1}, MakeDefaultPredicate(), deal);
    ASSERT_TRUE(engine.Play("t", 0, Cards("3D")).has_value());

    TurnState const s = engine.GetState("t");
    EXPECT_EQ(s.match_number, 2u);
    EXPECT_EQ(s.phase, Phase::Playing);
    EXPECT_EQ(s.current_turn, 0);

    std::shared_ptr<SeatView const> const v = engine.ViewFor("t", 0);
    auto const lead = std::ranges::find_if(v->my_hand, [](Card const& c) { return c != C("3D"); });
    ASSERT_NE(lead, v->my_hand.end());

    TransitionResult const res = engine.Play("t", 0, {*lead});
    ASSERT_TRUE(res.has_value());
    ASSERT_TRUE(engine.GetState("t").last_play.has_value());
    EXPECT_EQ(engine.GetState("t").last_play->combo.cards, std::vector<Card>{*lead});
}

TEST(Engine, ConcurrentSeatsSerializeThroughTheRoom)
{
    Engine engine = MakeEngine();
    engine.CreateRoom("t", Config{.seed = 77});

    std::mutex seen_mtx;
    std::set<uint64_t> versions;
    std::atomic<uint32_t> applied{0};
    std::atomic<uint32_t> unexpected{0};

    auto seat_loop = [&](SeatIdxT const seat)
    {
        for (int i = 0; i < 400; ++i)
        {
            std::shared_ptr<SeatView const> const v = engine.ViewFor("t", seat);
            if (v->state.phase == Phase::GameOver) return;
            TransitionResult res = std::unexpected(error::Viol(RVC::NotYourTurn));
            if (v->state.current_turn == seat)
            {
                PlayerAction const a = DefaultAction(*v);
                res = std::holds_alternative<PassAction>(a)
                    ? engine.Pass("t", seat)
                    : engine.Play("t", seat, std::get<PlayAction>(a).cards);
            }
            else if (i % 7 == 0)
            {
                // out of turn on purpose every so often
                res = engine.Pass("t", seat);
            }
            else
            {
                std::this_thread::yield();
                continue;
            }

            if (res.has_value())
            {
                ++applied;
                std::lock_guard lock(seen_mtx);
                if (!versions.insert(res->version).second) ++unexpected;
            }
            else if (res.error().code == RVC::StaleTimerSequence)
            {
                ++unexpected;
            }
        }
    };

    std::vector<std::thread> threads;
    for (SeatIdxT seat{}; seat < constants::NumSeats; ++seat)
    {
        threads.emplace_back(seat_loop, seat);
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(unexpected.load(), 0u);
    EXPECT_GT(applied.load(), 0u);

    ASSERT_FALSE(versions.empty());
    TurnState const s = engine.GetState("t");
    EXPECT_EQ(s.version, *versions.rbegin());
    EXPECT_LT(s.consecutive_passes, 3);
    uint32_t held{};
    for (uint8_t n : s.hand_counts) held += n;
    EXPECT_LE(held, constants::NumSeats * constants::HandSize);
}
