//
// AutoPass.cpp
//

#include "AutoPass.hpp"

#include <thread>

#include <fmt/format.h>

namespace bigtwo::core
{
    using RVC = error::RuleViolationCode;

    static auto StillRunning(TurnState const& s, uint64_t const sequence_id) -> bool
    {
        ActiveTimer const* t = ActiveOf(s.timer);
        return t != nullptr && t->sequence_id == sequence_id;
    }

    auto IsExpired(AutoPassTimer const& timer, int64_t const now_ms) -> bool
    {
        ActiveTimer const* t = ActiveOf(timer);
        return t != nullptr && now_ms >= t->end_timestamp_ms;
    }

    auto RunCascade(LiveStateFn const& live,
                    CascadePassFn const& pass,
                    ActiveTimer const& timer,
                    uint32_t const lock_retries) -> CascadeReport
    {
        CascadeReport report{};
        report.ran = true;
        report.sequence_id = timer.sequence_id;
        report.exempt_seat = timer.exempt_seat;

        std::size_t const max_steps = constants::NumSeats * (static_cast<std::size_t>(lock_retries) + 2);
        uint32_t conflicts{};

        for (std::size_t step{}; step < max_steps; ++step)
        {
            TurnState const s = live();
            if (!StillRunning(s, timer.sequence_id)) break;

            SeatIdxT const seat = s.current_turn;
            if (seat == timer.exempt_seat) break;

            auto const res = pass(seat, timer.sequence_id);
            if (res.has_value())
            {
                report.passed.push_back(seat);
                conflicts = 0;
                continue;
            }

            error::RuleViolation const& v = res.error();
            if (v.code == RVC::NotYourTurn)
            {
                // someone else moved this seat first
                fmt::print("[autopass] seq {} seat {} already moved: {}\n",
                           timer.sequence_id, static_cast<int>(seat), error::describe(v));
                ++report.swallowed;
                continue;
            }
            if (v.code == RVC::RoomLockConflict)
            {
                if (++conflicts > lock_retries)
                {
                    fmt::print("[autopass] seq {} gave up on seat {} after {} lock conflicts\n",
                               timer.sequence_id, static_cast<int>(seat), conflicts - 1);
                    break;
                }
                ++report.lock_retries;
                std::this_thread::yield();
                continue;
            }
            if (v.code == RVC::StaleTimerSequence)
            {
                break;
            }

            fmt::print("[autopass] seq {} pass for seat {} rejected: {}\n",
                       timer.sequence_id, static_cast<int>(seat), error::describe(v));
            ++report.swallowed;
            break;
        }

        report.completed = !StillRunning(live(), timer.sequence_id);
        return report;
    }
}
