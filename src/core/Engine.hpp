//
// Engine.hpp
//

#ifndef BIGTWO_ENGINE_HPP
#define BIGTWO_ENGINE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Room.hpp"

namespace bigtwo::core
{
    // Registry of rooms sharing one clock. Rule violations come back as values;
    // asking for a room that does not exist throws.
    class Engine
    {
    public:
        explicit Engine(std::shared_ptr<Clock const> clock);

        auto CreateRoom(RoomId const& id,
                        Config const& cfg,
                        std::unique_ptr<UnbeatablePredicate> predicate = MakeDefaultPredicate(),
                        std::optional<DealT> first_deal = std::nullopt) -> void;
        auto RemoveRoom(RoomId const& id) -> bool;
        auto HasRoom(RoomId const& id) const -> bool;
        auto RoomIds() const -> std::vector<RoomId>;

        auto Play(RoomId const& id, SeatIdxT seat, std::vector<Card> const& cards) -> TransitionResult;
        auto Pass(RoomId const& id, SeatIdxT seat) -> TransitionResult;
        auto GetState(RoomId const& id) const -> TurnState;
        auto ViewFor(RoomId const& id, SeatIdxT seat) const -> std::shared_ptr<SeatView const>;
        auto History(RoomId const& id) const -> std::vector<MatchRecord>;

        // Idempotent; a second call for the same expiry is a no-op.
        auto OnTimerExpired(RoomId const& id) -> CascadeReport;
        // Runs OnTimerExpired for every room whose timer is due. Returns those rooms.
        auto ExpireDueTimers() -> std::vector<RoomId>;

    private:
        auto Find(RoomId const& id) const -> std::shared_ptr<Room>;

    private:
        std::shared_ptr<Clock const> clock_;
        mutable std::mutex rooms_mtx_;
        std::unordered_map<RoomId, std::shared_ptr<Room>> rooms_;
    };
}

#endif //BIGTWO_ENGINE_HPP
