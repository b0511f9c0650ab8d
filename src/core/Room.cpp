//
// Room.cpp
//

#include "Room.hpp"

#include <utility>

#include <fmt/format.h>

#include "ClassicRules.hpp"

namespace bigtwo::core
{
    namespace
    {
        // Clears the flag on every exit path of a cascade.
        struct FlagRelease
        {
            std::atomic<bool>& flag;
            ~FlagRelease() { flag.store(false, std::memory_order_release); }
        };
    }

    Room::Room(RoomId id,
               Config const& cfg,
               std::shared_ptr<Clock const> clock,
               std::unique_ptr<UnbeatablePredicate> predicate,
               std::optional<DealT> first_deal) :
        id_(std::move(id)),
        cfg_(cfg),
        clock_(clock),
        game_(cfg, std::make_unique<ClassicRules>(), std::move(clock), std::move(predicate), {}, std::move(first_deal))
    {
        std::lock_guard lock(mtx_);
        Publish();
    }

    auto Room::Publish() -> void
    {
        auto state = std::make_shared<TurnState const>(game_.State());
        std::array<std::shared_ptr<SeatView const>, constants::NumSeats> views{};
        for (SeatIdxT seat{}; seat < constants::NumSeats; ++seat)
        {
            views[seat] = game_.SnapshotFor(seat);
        }

        std::lock_guard lock(published_mtx_);
        published_ = std::move(state);
        views_ = std::move(views);
        history_ = game_.Totals().History();
    }

    auto Room::Transition(SeatIdxT const seat,
                          PlayerAction const& a,
                          std::optional<uint64_t> const timer_seq) -> TransitionResult
    {
        std::unique_lock lock(mtx_, std::try_to_lock);
        if (!lock.owns_lock())
        {
            return std::unexpected(error::Viol(error::RuleViolationCode::RoomLockConflict).with_actor(seat));
        }

        if (timer_seq)
        {
            ActiveTimer const* t = ActiveOf(game_.Timer());
            if (t == nullptr || t->sequence_id != *timer_seq)
            {
                return std::unexpected(error::Viol(error::RuleViolationCode::StaleTimerSequence)
                    .with_actor(seat)
                    .with_sequence(*timer_seq));
            }
        }

        auto const res = game_.Submit(seat, a);
        if (!res.has_value())
        {
            return std::unexpected(res.error());
        }
        Publish();
        return game_.State();
    }

    auto Room::Play(SeatIdxT const seat, std::vector<Card> const& cards) -> TransitionResult
    {
        return Transition(seat, PlayAction{cards}, std::nullopt);
    }

    auto Room::Pass(SeatIdxT const seat) -> TransitionResult
    {
        return Transition(seat, PassAction{}, std::nullopt);
    }

    auto Room::GetState() const -> TurnState
    {
        std::lock_guard lock(published_mtx_);
        return *published_;
    }

    auto Room::ViewFor(SeatIdxT const seat) const -> std::shared_ptr<SeatView const>
    {
        std::lock_guard lock(published_mtx_);
        return views_.at(seat);
    }

    auto Room::History() const -> std::vector<MatchRecord>
    {
        std::lock_guard lock(published_mtx_);
        return history_;
    }

    auto Room::TimerDue() const -> bool
    {
        return IsExpired(GetState().timer, clock_->NowMs());
    }

    auto Room::OnTimerExpired() -> CascadeReport
    {
        if (cascade_running_.exchange(true, std::memory_order_acq_rel))
        {
            return CascadeReport{};
        }
        FlagRelease const release{cascade_running_};

        TurnState const s = GetState();
        ActiveTimer const* t = ActiveOf(s.timer);
        if (t == nullptr || clock_->NowMs() < t->end_timestamp_ms)
        {
            return CascadeReport{};
        }
        ActiveTimer const timer = *t;

        fmt::print("[autopass] room {} seq {} expired, exempt seat {}\n",
                   id_, timer.sequence_id, static_cast<int>(timer.exempt_seat));

        return RunCascade(
            [this] { return GetState(); },
            [this](SeatIdxT const seat, uint64_t const seq) { return Transition(seat, PassAction{}, seq); },
            timer,
            cfg_.cascade_lock_retries);
    }
}
