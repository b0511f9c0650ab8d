//
// ClockSync.hpp
//

#ifndef BIGTWO_CLOCKSYNC_HPP
#define BIGTWO_CLOCKSYNC_HPP

#include <optional>

#include "Exception.hpp"
#include "State.hpp"

namespace bigtwo::core
{
    // Observer-side countdown. The clock offset is measured once per timer
    // sequence and held for that timer's lifetime so redraws never jitter.
    class CountdownTracker
    {
    public:
        CountdownTracker() = default;

        // Rejects snapshots older than the newest one seen.
        auto Observe(TurnState const& state, int64_t local_receipt_ms) -> error::ValidateResult;

        // Rejects timers whose sequence_id is below the newest one seen.
        auto ObserveTimer(AutoPassTimer const& timer, int64_t local_receipt_ms) -> error::ValidateResult;

        // nullopt while no timer is visible
        [[nodiscard]] auto RemainingMs(int64_t local_now_ms) const -> std::optional<int64_t>;
        [[nodiscard]] auto CorrectedNow(int64_t local_now_ms) const -> int64_t { return local_now_ms + offset_ms_; }

        [[nodiscard]] auto OffsetMs() const noexcept -> int64_t { return offset_ms_; }
        [[nodiscard]] auto IsSynced() const noexcept -> bool { return active_.has_value(); }
        [[nodiscard]] auto Active() const noexcept -> std::optional<ActiveTimer> const& { return active_; }
        [[nodiscard]] auto LastSequence() const noexcept -> uint64_t { return last_sequence_; }

    private:
        std::optional<ActiveTimer> active_{};
        int64_t offset_ms_{};
        uint64_t last_sequence_{};
        std::optional<uint64_t> last_version_{};
    };
}

#endif //BIGTWO_CLOCKSYNC_HPP
