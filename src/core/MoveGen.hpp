//
// MoveGen.hpp
//

#ifndef BIGTWO_MOVEGEN_HPP
#define BIGTWO_MOVEGEN_HPP

#include <optional>
#include <span>
#include <vector>

#include "Actions.hpp"
#include "Combo.hpp"
#include "State.hpp"

namespace bigtwo::core
{
    // Every single, pair, triple and 5-card combo the hand can form.
    auto EnumerateCombos(std::span<Card const> hand) -> std::vector<Combo>;

    // Combos from the seat's hand that ValidatePlay accepts right now.
    auto LegalPlays(SeatView const& view) -> std::vector<Combo>;

    // Fewest cards first, then lowest type, then lowest key.
    auto Weaker(Combo const& a, Combo const& b) -> bool;

    // Weakest legal play, nullopt when nothing is playable.
    auto RecommendPlay(SeatView const& view) -> std::optional<Combo>;

    // Pass when the rules allow it, otherwise the weakest legal play.
    auto DefaultAction(SeatView const& view) -> PlayerAction;
}

#endif //BIGTWO_MOVEGEN_HPP
