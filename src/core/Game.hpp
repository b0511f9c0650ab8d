//
// Game.hpp
//

#ifndef BIGTWO_GAME_HPP
#define BIGTWO_GAME_HPP

#include <expected>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"
#include "Judge.hpp"
#include "Clock.hpp"
#include "Scoring.hpp"
#include "Unbeatable.hpp"
#include "Util.hpp"

namespace bigtwo::core::debug {struct Inspector;}
namespace bigtwo::core
{
    using DealT = std::array<HandT, constants::NumSeats>;

    // Authoritative state for one room. Not thread safe; Room serializes access.
    class GameImpl
    {
    public:
        GameImpl() = delete;

        // first_deal replaces the shuffled deal of match 1 (replays, fixtures).
        // players may be empty when moves arrive through Submit only.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::shared_ptr<Clock const> clock,
                 std::unique_ptr<UnbeatablePredicate> predicate = MakeDefaultPredicate(),
                 std::vector<std::unique_ptr<Player>> players = {},
                 std::optional<DealT> first_deal = std::nullopt);

        // Validate, apply, advance. Rule violations come back as values.
        auto Submit(SeatIdxT seat, PlayerAction const& a) -> std::expected<MoveOutcome, error::RuleViolation>;

        // One bot-driven step: ask the seat holding the turn through the Judge.
        auto Step() -> MoveOutcome;

        auto State() const -> TurnState;
        auto SnapshotFor(SeatIdxT seat) const -> std::shared_ptr<SeatView const>;

        auto CurrentTurn() const noexcept -> SeatIdxT { return current_turn_; }
        auto PhaseNow() const noexcept -> Phase { return phase_; }
        auto MatchNumber() const noexcept -> uint32_t { return match_number_; }
        auto Timer() const noexcept -> AutoPassTimer const& { return timer_; }
        auto Totals() const noexcept -> GameTotals const& { return totals_; }
        auto Hand(SeatIdxT seat) const -> std::span<Card const> { return hands_.at(seat); }
        auto Played() const noexcept -> std::span<Card const> { return played_; }
        auto Cfg() const noexcept -> Config const& { return cfg_; }
        auto Predicate() const noexcept -> UnbeatablePredicate const& { return *predicate_; }
        auto HasPlayers() const noexcept -> bool { return !players_.empty(); }
        auto PlayerAt(SeatIdxT seat) -> Player* { return players_.at(seat).get(); }

        //allows class to directly access private data on an instance
        friend class ClassicRules;
        friend class Judge;
        friend struct debug::Inspector;

        // Throws if the seat does not hold every card.
        auto MoveHandToPlayed(SeatIdxT seat, std::span<Card const> cards) -> void;
        // 3 passes: drop the lead, hand the turn to the exempt seat or the trick winner.
        auto ClearTrick() -> void;
        // Score the match that the winner just emptied, then redeal or stop.
        auto EndMatch(SeatIdxT winner) -> MoveOutcome;
        // Judge the play just applied and install the matching timer value.
        auto RefreshTimer(SeatIdxT actor, Combo const& play, util::CardMask played_before) -> void;

    private:
        //Produces a shuffled deal
        auto BuildDeal() -> DealT;
        auto StartMatch(DealT deal) -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::shared_ptr<Clock const> clock_;
        std::unique_ptr<UnbeatablePredicate> predicate_;
        std::vector<std::unique_ptr<Player>> players_;
        std::mt19937_64 rng_;
        std::shared_ptr<Judge> judge_;

        // Authoritative state
        DealT hands_{};                 // [seat] sorted ascending
        std::vector<Card> played_;      // public pile of the current match
        util::CardMask dealt_{};        // every card in play this match

        // Turn/match state
        SeatIdxT current_turn_{0};
        std::optional<LastPlay> last_play_{};
        uint8_t consecutive_passes_{0};
        uint32_t match_number_{0};
        Phase phase_{Phase::FirstPlay};
        std::optional<SeatIdxT> last_winner_{};

        AutoPassTimer timer_{NoTimer{}};
        uint64_t timer_sequence_{0};

        GameTotals totals_{};
        ComboCountsT combos_this_match_{};
        uint64_t version_{0};
    };
}
#endif //BIGTWO_GAME_HPP
