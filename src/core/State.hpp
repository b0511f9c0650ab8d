//
// State.hpp
//

#ifndef BIGTWO_STATE_HPP
#define BIGTWO_STATE_HPP

#include <array>
#include <optional>
#include <variant>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Combo.hpp"

namespace bigtwo::core
{
    struct LastPlay
    {
        SeatIdxT seat{};
        Combo combo{};
    };

    struct NoTimer {};

    struct ActiveTimer
    {
        SeatIdxT exempt_seat{};
        int64_t end_timestamp_ms{};
        int64_t server_time_at_creation_ms{};
        uint64_t sequence_id{};
        Combo triggering_combo{};
    };

    // Never edited in place: every transition installs a fresh value.
    using AutoPassTimer = std::variant<NoTimer, ActiveTimer>;

    inline auto ActiveOf(AutoPassTimer const& t) -> ActiveTimer const*
    {
        return std::get_if<ActiveTimer>(&t);
    }
    // would dangle once the temporary holding the timer is gone
    auto ActiveOf(AutoPassTimer&&) -> ActiveTimer const* = delete;

    using HandCountsT = std::array<uint8_t, constants::NumSeats>;
    using ScoreArrayT = std::array<uint32_t, constants::NumSeats>;

    // Immutable snapshot exposed to callers/observers.
    struct TurnState
    {
        SeatIdxT current_turn{};
        std::optional<LastPlay> last_play{};
        uint8_t consecutive_passes{};
        uint32_t match_number{1};
        Phase phase{Phase::FirstPlay};

        HandCountsT hand_counts{};
        AutoPassTimer timer{NoTimer{}};
        ScoreArrayT totals{};
        std::optional<SeatIdxT> last_match_winner{};

        // bumped on every committed transition
        uint64_t version{};
    };

    // What a single seat is allowed to see.
    struct SeatView
    {
        SeatIdxT seat{};
        TurnState state{};
        std::vector<Card> my_hand;
        std::vector<Card> played; // public pile of the current match
    };

} // namespace bigtwo::core

#endif //BIGTWO_STATE_HPP
