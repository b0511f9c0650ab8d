//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include "Game.hpp"
#include "Util.hpp"
#include "Validator.hpp"

namespace bigtwo::core
{
    auto ClassicRules::Validate(GameImpl const& game, SeatIdxT const seat, PlayerAction const& a) const -> CheckResult
    {
        if (seat >= constants::NumSeats)
            BIGTWO_THROW(error::Code::InvalidAction, "Seat index out of range");

        TurnState const state = game.State();
        std::span<Card const> const hand = game.hands_[seat];

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayAction>)
            {
                auto res = ValidatePlay(seat, act.cards, state, hand);
                if (!res.has_value()) return std::unexpected(res.error());
                return ValidatedMove{seat, std::move(*res)};
            }
            else
            {
                if (auto const ok = ValidatePass(seat, state, hand); !ok.has_value())
                    return std::unexpected(ok.error());
                return ValidatedMove{seat, std::nullopt};
            }
        }, a);
    }

    auto ClassicRules::Apply(GameImpl& game, ValidatedMove move) -> void
    {
        SeatIdxT const seat = move.seat;
        if (move.play)
        {
            Combo& combo = *move.play;
            util::CardMask const played_before = util::MaskOf(game.played_);
            game.MoveHandToPlayed(seat, combo.cards);
            ++game.combos_this_match_[seat][std::to_underlying(combo.type)];

            if (game.phase_ == Phase::FirstPlay)
            {
                game.phase_ = Phase::Playing;
            }
            game.consecutive_passes_ = 0;
            // A new lead always replaces the countdown, with a fresh one or with none.
            game.RefreshTimer(seat, combo, played_before);
            game.last_play_ = LastPlay{seat, std::move(combo)};
        }
        else
        {
            // Passing leaves the countdown alone; only the trick clear ends it.
            ++game.consecutive_passes_;
        }
        game.current_turn_ = NextSeat(seat);
    }

    auto ClassicRules::Advance(GameImpl& game) -> MoveOutcome
    {
        if (game.last_play_ && game.hands_[game.last_play_->seat].empty())
        {
            return game.EndMatch(game.last_play_->seat);
        }

        if (game.consecutive_passes_ >= constants::PassesToClearTrick)
        {
            game.ClearTrick();
            return MoveOutcome::TrickCleared;
        }
        return MoveOutcome::Applied;
    }
}
