//
// Room.hpp
//

#ifndef BIGTWO_ROOM_HPP
#define BIGTWO_ROOM_HPP

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "AutoPass.hpp"
#include "Game.hpp"

namespace bigtwo::core
{
    using RoomId = std::string;
    using TransitionResult = std::expected<TurnState, error::RuleViolation>;

    // The single authoritative mutator of one room. Transitions never wait for
    // the room lock: a contended call fails with RoomLockConflict.
    class Room
    {
    public:
        Room(RoomId id,
             Config const& cfg,
             std::shared_ptr<Clock const> clock,
             std::unique_ptr<UnbeatablePredicate> predicate = MakeDefaultPredicate(),
             std::optional<DealT> first_deal = std::nullopt);

        Room(Room const&) = delete;
        auto operator=(Room const&) -> Room& = delete;

        auto Play(SeatIdxT seat, std::vector<Card> const& cards) -> TransitionResult;
        auto Pass(SeatIdxT seat) -> TransitionResult;

        // Lock free with respect to transitions.
        auto GetState() const -> TurnState;
        auto ViewFor(SeatIdxT seat) const -> std::shared_ptr<SeatView const>;
        auto History() const -> std::vector<MatchRecord>;

        // Safe to call from anyone at any time; no-op unless the timer is due.
        auto OnTimerExpired() -> CascadeReport;
        auto TimerDue() const -> bool;

        auto Id() const noexcept -> RoomId const& { return id_; }

    private:
        // timer_seq set: only pass if that timer is still the live one.
        auto Transition(SeatIdxT seat, PlayerAction const& a, std::optional<uint64_t> timer_seq) -> TransitionResult;
        // Caller holds mtx_.
        auto Publish() -> void;

    private:
        RoomId id_;
        Config cfg_;
        std::shared_ptr<Clock const> clock_;

        std::mutex mtx_;
        GameImpl game_;

        mutable std::mutex published_mtx_;
        std::shared_ptr<TurnState const> published_;
        std::array<std::shared_ptr<SeatView const>, constants::NumSeats> views_{};
        std::vector<MatchRecord> history_;

        std::atomic<bool> cascade_running_{false};
    };
}

#endif //BIGTWO_ROOM_HPP
