//
// Actions.hpp
//

#ifndef BIGTWO_ACTIONS_HPP
#define BIGTWO_ACTIONS_HPP

#include "Types.hpp"

namespace bigtwo::core
{
    struct PlayAction { std::vector<Card> cards; };
    struct PassAction {};

    using PlayerAction = std::variant<PlayAction, PassAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TrickCleared,
        MatchEnded,
        GameEnded
    };

    enum class Phase : uint8_t
    {
        FirstPlay, // match 1 opening trick, 3D required
        Playing,
        Finished,
        GameOver
    };
} // namespace bigtwo::core

#endif //BIGTWO_ACTIONS_HPP
