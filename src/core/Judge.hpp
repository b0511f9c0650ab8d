//
// Judge.hpp
//

#ifndef BIGTWO_JUDGE_HPP
#define BIGTWO_JUDGE_HPP

#include <chrono>

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bigtwo::core
{
    class GameImpl;

    enum class DesicionResult : uint8_t
    {
        OK,
        Timeout,
        Rejected // player answered with an illegal move
    };

    struct TimedDecision
    {
        PlayerAction action{};
        DesicionResult result{};
        std::chrono::milliseconds elapsed{};
    };

    class Judge
    {
    public:
        Judge() = default;

        // Never returns a move the rules would reject.
        auto GetAction(GameImpl& game, SeatIdxT actor) const -> TimedDecision;
    };
}
#endif //BIGTWO_JUDGE_HPP
