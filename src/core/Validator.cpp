//
// Validator.cpp
//

#include "Validator.hpp"

#include <algorithm>

#include "Util.hpp"

namespace bigtwo::core
{
    using RVC = error::RuleViolationCode;
    using error::Viol;

    static auto InProgress(Phase const p) -> bool
    {
        return p == Phase::FirstPlay || p == Phase::Playing;
    }

    auto FindHighestBeatingSingle(std::span<Card const> hand, Combo const* last) -> std::optional<Card>
    {
        std::optional<Card> best{};
        for (Card const& c : hand)
        {
            if (last != nullptr && Value(c) <= last->key) continue;
            if (!best || Value(c) > Value(*best)) best = c;
        }
        return best;
    }

    auto OneCardLeftActive(SeatIdxT const seat, TurnState const& state) -> bool
    {
        if (!state.last_play || state.last_play->combo.type != ComboType::Single) return false;
        return state.hand_counts[NextSeat(seat)] == 1;
    }

    auto ValidatePlay(SeatIdxT const seat,
                      std::span<Card const> cards,
                      TurnState const& state,
                      std::span<Card const> hand) -> std::expected<Combo, error::RuleViolation>
    {
        auto const attempted = static_cast<std::uint8_t>(cards.size());

        if (!InProgress(state.phase))
            return std::unexpected(Viol(RVC::GameNotInProgress).with_phase(state.phase).with_actor(seat));

        if (seat != state.current_turn)
            return std::unexpected(Viol(RVC::NotYourTurn)
                                   .with_actor(seat).with_turn(state.current_turn));

        if (!util::HoldsAll(hand, cards))
            return std::unexpected(Viol(RVC::CardsNotOwned)
                                   .with_actor(seat).with_attempted(attempted));

        std::optional<Combo> combo = Classify(cards);
        if (!combo)
            return std::unexpected(Viol(RVC::InvalidCombo)
                                   .with_actor(seat).with_attempted(attempted));

        Combo const* last = LastCombo(state);
        if (!CanBeat(*combo, last))
            return std::unexpected(Viol(RVC::CannotBeatLastPlay)
                                   .with_actor(seat).with_attempted(attempted));

        if (state.phase == Phase::FirstPlay
            && std::ranges::find(combo->cards, ThreeOfDiamonds) == combo->cards.end())
            return std::unexpected(Viol(RVC::MissingRequiredCard)
                                   .with_actor(seat).with_phase(state.phase).with_required(ThreeOfDiamonds));

        if (OneCardLeftActive(seat, state))
        {
            // A play that got this far matches the single lead, so it is a beating single.
            std::optional<Card> const required = FindHighestBeatingSingle(hand, last);
            if (required && combo->cards.front() != *required)
                return std::unexpected(Viol(RVC::OneCardLeftViolation)
                                       .with_actor(seat).with_required(*required));
        }

        return std::move(*combo);
    }

    auto ValidatePass(SeatIdxT const seat,
                      TurnState const& state,
                      std::span<Card const> hand) -> error::ValidateResult
    {
        if (!InProgress(state.phase))
            return std::unexpected(Viol(RVC::GameNotInProgress).with_phase(state.phase).with_actor(seat));

        if (seat != state.current_turn)
            return std::unexpected(Viol(RVC::NotYourTurn)
                                   .with_actor(seat).with_turn(state.current_turn));

        if (!state.last_play)
            return std::unexpected(Viol(RVC::CannotPassWhileLeading).with_actor(seat));

        if (OneCardLeftActive(seat, state))
        {
            if (std::optional<Card> const required = FindHighestBeatingSingle(hand, LastCombo(state)))
                return std::unexpected(Viol(RVC::OneCardLeftViolation)
                                       .with_actor(seat).with_required(*required));
        }
        return {};
    }
}
