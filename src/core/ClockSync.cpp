//
// ClockSync.cpp
//

#include "ClockSync.hpp"

#include <algorithm>

namespace bigtwo::core
{
    using RVC = error::RuleViolationCode;

    auto CountdownTracker::Observe(TurnState const& state, int64_t const local_receipt_ms) -> error::ValidateResult
    {
        if (last_version_ && state.version < *last_version_)
        {
            ActiveTimer const* t = ActiveOf(state.timer);
            auto v = error::Viol(RVC::StaleTimerSequence);
            if (t) v.with_sequence(t->sequence_id);
            return std::unexpected(v);
        }
        last_version_ = state.version;
        return ObserveTimer(state.timer, local_receipt_ms);
    }

    auto CountdownTracker::ObserveTimer(AutoPassTimer const& timer, int64_t const local_receipt_ms) -> error::ValidateResult
    {
        ActiveTimer const* t = ActiveOf(timer);
        if (t == nullptr)
        {
            active_.reset();
            return {};
        }

        // a timer already seen and since cleared is stale as well
        bool const cleared_before = !active_ && last_sequence_ != 0 && t->sequence_id == last_sequence_;
        if (t->sequence_id < last_sequence_ || cleared_before)
            return std::unexpected(error::Viol(RVC::StaleTimerSequence).with_sequence(t->sequence_id));

        if (active_ && t->sequence_id == active_->sequence_id)
            return {}; // same timer redelivered, keep the original offset

        last_sequence_ = t->sequence_id;
        active_ = *t;
        offset_ms_ = t->server_time_at_creation_ms - local_receipt_ms;
        return {};
    }

    auto CountdownTracker::RemainingMs(int64_t const local_now_ms) const -> std::optional<int64_t>
    {
        if (!active_) return std::nullopt;
        int64_t const remaining = active_->end_timestamp_ms - CorrectedNow(local_now_ms);
        return std::max<int64_t>(remaining, 0);
    }
}
