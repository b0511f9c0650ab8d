//
// Validator.hpp
//

#ifndef BIGTWO_VALIDATOR_HPP
#define BIGTWO_VALIDATOR_HPP

#include <expected>
#include <optional>
#include <span>

#include "Combo.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace bigtwo::core
{
    inline constexpr auto NextSeat(SeatIdxT const idx) -> SeatIdxT
    {
        return static_cast<SeatIdxT>((idx + 1) % constants::NumSeats);
    }

    inline auto LastCombo(TurnState const& s) -> Combo const*
    {
        return s.last_play ? &s.last_play->combo : nullptr;
    }

    // Highest card in hand that beats a single lead. With no lead, the highest card.
    auto FindHighestBeatingSingle(std::span<Card const> hand, Combo const* last) -> std::optional<Card>;

    // Next seat is down to one card and the lead is a single.
    auto OneCardLeftActive(SeatIdxT seat, TurnState const& state) -> bool;

    // Checks run in a fixed order and the first failure is returned:
    // turn, ownership, classification, beat, opening 3D, One-Card-Left.
    auto ValidatePlay(SeatIdxT seat,
                      std::span<Card const> cards,
                      TurnState const& state,
                      std::span<Card const> hand) -> std::expected<Combo, error::RuleViolation>;

    auto ValidatePass(SeatIdxT seat,
                      TurnState const& state,
                      std::span<Card const> hand) -> error::ValidateResult;
}

#endif //BIGTWO_VALIDATOR_HPP
