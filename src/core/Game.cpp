//
// Game.cpp
//
#include "Game.hpp"

#include <algorithm>
#include <bit>
#include <utility>

#include <fmt/format.h>

#include "Validator.hpp"

namespace bigtwo::core
{
    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::shared_ptr<Clock const> clock,
                       std::unique_ptr<UnbeatablePredicate> predicate,
                       std::vector<std::unique_ptr<Player>> players,
                       std::optional<DealT> first_deal) :
        cfg_(config),
        rules_(std::move(rules)),
        clock_(std::move(clock)),
        predicate_(std::move(predicate)),
        players_(std::move(players)),
        rng_{cfg_.seed},
        judge_(std::make_shared<Judge>())
    {
        BIGTWO_ASSERT(rules_ != nullptr, "No rules while initalising core");
        BIGTWO_ASSERT(clock_ != nullptr, "No clock while initalising core");
        BIGTWO_ASSERT(predicate_ != nullptr, "No unbeatable predicate while initalising core");
        BIGTWO_ASSERT(players_.empty() || players_.size() == constants::NumSeats,
                      "Players must be absent or fill every seat");
        BIGTWO_ASSERT(!std::ranges::any_of(players_,
                                           [](std::unique_ptr<Player> const& p) { return !p; }), "Invalid player in core");
        StartMatch(first_deal ? std::move(*first_deal) : BuildDeal());
    }

    auto GameImpl::BuildDeal() -> DealT
    {
        std::vector<Card> deck;
        deck.reserve(constants::DeckSize);
        for (size_t uid{}; uid < constants::DeckSize; ++uid)
        {
            deck.push_back(util::CardFromUID(uid));
        }
        std::ranges::shuffle(deck, rng_);

        DealT deal{};
        //will not deal round robin as with a randomly shuffled deck
        //dealing order should not matter.
        for (auto& hand : deal)
        {
            while (hand.size() < constants::HandSize)
            {
                hand.push_back(deck.back());
                deck.pop_back();
            }
        }
        return deal;
    }

    auto GameImpl::StartMatch(DealT deal) -> void
    {
        util::CardUniqueChecker checker{};
        for (HandT const& hand : deal)
        {
            if (hand.empty())
                BIGTWO_THROW(error::Code::State, "Deal leaves a seat without cards");
            for (Card const& c : hand) checker.Add(c);
        }
        if (checker.ContainsDup())
            BIGTWO_THROW(error::Code::State, "Deal contains duplicate cards");

        ++match_number_;
        hands_ = std::move(deal);
        for (HandT& hand : hands_) util::SortCards(hand);
        played_.clear();
        dealt_ = checker.Mask();

        last_play_.reset();
        consecutive_passes_ = 0;
        timer_ = NoTimer{};
        combos_this_match_ = {};

        if (match_number_ == 1 || !last_winner_)
        {
            // Lowest card leads; with a full deck that is always the 3D.
            Card const lowest = util::CardFromUID(static_cast<uint64_t>(std::countr_zero(dealt_)));
            auto const holder = std::ranges::find_if(hands_, [&lowest](HandT const& h)
            {
                return std::ranges::find(h, lowest) != h.end();
            });
            current_turn_ = static_cast<SeatIdxT>(std::distance(hands_.begin(), holder));
            phase_ = (lowest == ThreeOfDiamonds) ? Phase::FirstPlay : Phase::Playing;
        }
        else
        {
            current_turn_ = *last_winner_;
            phase_ = Phase::Playing;
        }
    }

    auto GameImpl::State() const -> TurnState
    {
        TurnState s{};
        s.current_turn = current_turn_;
        s.last_play = last_play_;
        s.consecutive_passes = consecutive_passes_;
        s.match_number = match_number_;
        s.phase = phase_;
        for (size_t seat{}; seat < constants::NumSeats; ++seat)
        {
            s.hand_counts[seat] = static_cast<uint8_t>(hands_[seat].size());
        }
        s.timer = timer_;
        s.totals = totals_.Totals();
        s.last_match_winner = last_winner_;
        s.version = version_;
        return s;
    }

    auto GameImpl::SnapshotFor(SeatIdxT seat) const -> std::shared_ptr<SeatView const>
    {
        std::shared_ptr<SeatView> snap = std::make_shared<SeatView>();
        snap->seat = seat;
        snap->state = State();
        snap->my_hand = hands_.at(seat);
        snap->played = played_;
        return snap;
    }

    auto GameImpl::MoveHandToPlayed(SeatIdxT const seat, std::span<Card const> cards) -> void
    {
        auto& hand = hands_.at(seat);
        for (Card const& c : cards)
        {
            auto const it = std::ranges::find(hand, c);
            BIGTWO_ASSERT(it != std::end(hand), fmt::format("Card {} not in hand of P{}", util::ToString(c), static_cast<int>(seat)));
            hand.erase(it);
            played_.push_back(c);
        }
    }

    auto GameImpl::RefreshTimer(SeatIdxT const actor, Combo const& play, util::CardMask const played_before) -> void
    {
        UnbeatableContext ctx{};
        ctx.actor = actor;
        ctx.played_before = played_before;
        for (size_t seat{}; seat < constants::NumSeats; ++seat)
        {
            ctx.hands[seat] = util::MaskOf(hands_[seat]);
        }

        if (!predicate_->IsUnbeatable(play, ctx))
        {
            timer_ = NoTimer{};
            return;
        }

        int64_t const now = clock_->NowMs();
        timer_ = ActiveTimer{
            .exempt_seat = actor,
            .end_timestamp_ms = now + cfg_.auto_pass_duration.count(),
            .server_time_at_creation_ms = now,
            .sequence_id = ++timer_sequence_,
            .triggering_combo = play
        };
    }

    auto GameImpl::ClearTrick() -> void
    {
        BIGTWO_ASSERT(last_play_.has_value(), "Trick cleared without a lead");

        SeatIdxT leader = last_play_->seat;
        if (ActiveTimer const* t = ActiveOf(timer_))
        {
            leader = t->exempt_seat;
        }

        last_play_.reset();
        consecutive_passes_ = 0;
        timer_ = NoTimer{};
        current_turn_ = leader;
    }

    auto GameImpl::EndMatch(SeatIdxT const winner) -> MoveOutcome
    {
        EndingHandSizesT sizes{};
        for (size_t seat{}; seat < constants::NumSeats; ++seat)
        {
            sizes[seat] = hands_[seat].size();
        }

        MatchRecord rec{};
        rec.match_number = match_number_;
        rec.winner = winner;
        rec.ending_hand_sizes = sizes;
        rec.score = ComputeMatchScore(sizes);
        rec.combos_played = combos_this_match_;
        totals_.Record(std::move(rec));

        last_winner_ = winner;
        last_play_.reset();
        consecutive_passes_ = 0;
        timer_ = NoTimer{};
        phase_ = Phase::Finished;

        if (IsGameOver(totals_.Totals(), cfg_.game_over_threshold))
        {
            phase_ = Phase::GameOver;
            return MoveOutcome::GameEnded;
        }

        StartMatch(BuildDeal());
        return MoveOutcome::MatchEnded;
    }

    auto GameImpl::Submit(SeatIdxT const seat, PlayerAction const& a) -> std::expected<MoveOutcome, error::RuleViolation>
    {
        Rules::CheckResult checked = rules_->Validate(*this, seat, a);
        if (!checked.has_value())
        {
            return std::unexpected(checked.error());
        }
        rules_->Apply(*this, std::move(*checked));
        MoveOutcome const out = rules_->Advance(*this);
        ++version_;
        return out;
    }

    auto GameImpl::Step() -> MoveOutcome
    {
        BIGTWO_ASSERT(HasPlayers(), "Step requires a player in every seat");
        if (phase_ == Phase::GameOver) return MoveOutcome::GameEnded;

        SeatIdxT const actor = current_turn_;
        TimedDecision const dec = judge_->GetAction(*this, actor);
        if (dec.result == DesicionResult::Timeout)
        {
            fmt::print("[bigtwo] seat {} timed out after {} ms, default move used\n",
                       static_cast<int>(actor), dec.elapsed.count());
        }

        auto const res = Submit(actor, dec.action);
        if (!res.has_value())
        {
            fmt::print("{}\n", error::describe(res.error()));
            return MoveOutcome::Invalid;
        }
        return *res;
    }
}
