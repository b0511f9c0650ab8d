//
// Player.hpp
//

#ifndef BIGTWO_PLAYER_HPP
#define BIGTWO_PLAYER_HPP

#include <chrono>
#include <memory>

#include "Actions.hpp"
#include "State.hpp"

namespace bigtwo::core
{
    // Strategy seam for bots and remote seats. Sees only its own SeatView.
    class Player
    {
    public:
        virtual ~Player() = default;

        // Deadline is authoritative; on timeout the Judge substitutes a legal default.
        virtual auto ChooseMove(std::shared_ptr<SeatView const> view,
                                std::chrono::steady_clock::time_point deadline) -> PlayerAction = 0;
    };
}
#endif //BIGTWO_PLAYER_HPP
