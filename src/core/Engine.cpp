//
// Engine.cpp
//

#include "Engine.hpp"

#include <fmt/format.h>

namespace bigtwo::core
{
    Engine::Engine(std::shared_ptr<Clock const> clock) : clock_(std::move(clock))
    {
        BIGTWO_ASSERT(clock_ != nullptr, "No clock while initalising engine");
    }

    auto Engine::CreateRoom(RoomId const& id,
                            Config const& cfg,
                            std::unique_ptr<UnbeatablePredicate> predicate,
                            std::optional<DealT> first_deal) -> void
    {
        auto room = std::make_shared<Room>(id, cfg, clock_, std::move(predicate), std::move(first_deal));

        std::lock_guard lock(rooms_mtx_);
        if (rooms_.contains(id))
            BIGTWO_THROW(error::Code::State, fmt::format("Room '{}' already exists", id));
        rooms_.emplace(id, std::move(room));
    }

    auto Engine::RemoveRoom(RoomId const& id) -> bool
    {
        std::lock_guard lock(rooms_mtx_);
        return rooms_.erase(id) > 0;
    }

    auto Engine::HasRoom(RoomId const& id) const -> bool
    {
        std::lock_guard lock(rooms_mtx_);
        return rooms_.contains(id);
    }

    auto Engine::RoomIds() const -> std::vector<RoomId>
    {
        std::lock_guard lock(rooms_mtx_);
        std::vector<RoomId> ids;
        ids.reserve(rooms_.size());
        for (auto const& [id, room] : rooms_) ids.push_back(id);
        return ids;
    }

    auto Engine::Find(RoomId const& id) const -> std::shared_ptr<Room>
    {
        std::lock_guard lock(rooms_mtx_);
        auto const it = rooms_.find(id);
        if (it == rooms_.end())
            BIGTWO_THROW(error::Code::State, fmt::format("Unknown room '{}'", id));
        return it->second;
    }

    auto Engine::Play(RoomId const& id, SeatIdxT const seat, std::vector<Card> const& cards) -> TransitionResult
    {
        return Find(id)->Play(seat, cards);
    }

    auto Engine::Pass(RoomId const& id, SeatIdxT const seat) -> TransitionResult
    {
        return Find(id)->Pass(seat);
    }

    auto Engine::GetState(RoomId const& id) const -> TurnState
    {
        return Find(id)->GetState();
    }

    auto Engine::ViewFor(RoomId const& id, SeatIdxT const seat) const -> std::shared_ptr<SeatView const>
    {
        return Find(id)->ViewFor(seat);
    }

    auto Engine::History(RoomId const& id) const -> std::vector<MatchRecord>
    {
        return Find(id)->History();
    }

    auto Engine::OnTimerExpired(RoomId const& id) -> CascadeReport
    {
        return Find(id)->OnTimerExpired();
    }

    auto Engine::ExpireDueTimers() -> std::vector<RoomId>
    {
        std::vector<std::shared_ptr<Room>> rooms;
        {
            std::lock_guard lock(rooms_mtx_);
            rooms.reserve(rooms_.size());
            for (auto const& [id, room] : rooms_) rooms.push_back(room);
        }

        std::vector<RoomId> fired;
        for (auto const& room : rooms)
        {
            if (!room->TimerDue()) continue;
            if (room->OnTimerExpired().ran) fired.push_back(room->Id());
        }
        return fired;
    }
}
