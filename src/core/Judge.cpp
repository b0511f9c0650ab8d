//
// Judge.cpp
//
#include "Judge.hpp"
#include <future>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "Exception.hpp"
#include "Game.hpp"
#include "MoveGen.hpp"
#include "Player.hpp"
#include "Validator.hpp"

namespace bigtwo::core
{
    static auto IsLegal(SeatView const& v, PlayerAction const& a) -> bool
    {
        if (auto const* play = std::get_if<PlayAction>(&a))
        {
            return ValidatePlay(v.seat, play->cards, v.state, v.my_hand).has_value();
        }
        return ValidatePass(v.seat, v.state, v.my_hand).has_value();
    }

    auto Judge::GetAction(GameImpl& game, SeatIdxT actor) const -> TimedDecision
    {
        std::shared_ptr<SeatView const> snap = game.SnapshotFor(actor);
        auto const asked = std::chrono::steady_clock::now();
        auto const deadline = asked + game.cfg_.turn_timeout;
        auto const since = [asked]
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - asked);
        };

        std::packaged_task<PlayerAction()> task(
            [p = game.PlayerAt(actor),
             snp = snap,
             deadline]() mutable
            {
                return p->ChooseMove(std::move(snp), deadline);
            }
        );

        std::future<PlayerAction> fut = task.get_future();

        std::thread worker(std::move(task));
        worker.detach();

        if (fut.wait_until(deadline) == std::future_status::ready)
        {
            PlayerAction action = fut.get();
            if (IsLegal(*snap, action))
            {
                return {std::move(action), DesicionResult::OK, since()};
            }
            fmt::print("[bigtwo] seat {} proposed an illegal move, using default\n", static_cast<int>(actor));
            return {DefaultAction(*snap), DesicionResult::Rejected, since()};
        }

        //Timeout
        return {DefaultAction(*game.SnapshotFor(actor)), DesicionResult::Timeout, since()};
    }

}
