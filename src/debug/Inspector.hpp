//
// Inspector.hpp
//

#ifndef BIGTWO_INSPECTOR_HPP
#define BIGTWO_INSPECTOR_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace bigtwo::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::array<std::vector<Card>, constants::NumSeats> hands{};
            std::vector<Card> played;
            util::CardMask dealt{};
            Phase phase{};

            SeatIdxT current_turn{};
            std::optional<LastPlay> last_play{};
            uint8_t consecutive_passes{};
            AutoPassTimer timer{NoTimer{}};
            uint64_t timer_sequence{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.hands = g.hands_;
            ret.played = g.played_;
            ret.dealt = g.dealt_;
            ret.phase = g.phase_;
            ret.current_turn = g.current_turn_;
            ret.last_play = g.last_play_;
            ret.consecutive_passes = g.consecutive_passes_;
            ret.timer = g.timer_;
            ret.timer_sequence = g.timer_sequence_;
            return ret;
        }
    };
}

#endif //BIGTWO_INSPECTOR_HPP
