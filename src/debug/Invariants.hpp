//
// Invariants.hpp
//

#ifndef BIGTWO_INVARIANTS_HPP
#define BIGTWO_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "Inspector.hpp"
#include <cassert>

namespace bigtwo::core::debug
{
    // A second layer of checks run by the tests after every committed move.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if BIGTWO_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Every dealt card sits in exactly one hand or on the played pile
    {
        util::CardUniqueChecker seen{};
        for (auto const& h : s.hands) for (Card const& c : h) seen.Add(c);
        for (Card const& c : s.played) seen.Add(c);

        assert(!seen.ContainsDup() && "Card held twice across zones");
        assert(seen.Mask() == s.dealt && "Cards appeared or vanished since the deal");
    }

    // 2) A trick clears at three passes, so no state ever rests there
    assert(s.consecutive_passes < constants::PassesToClearTrick);

    // 3) While a match is running the seat to move still holds cards
    if (s.phase == Phase::FirstPlay || s.phase == Phase::Playing)
    {
        assert(!s.hands[s.current_turn].empty() && "Turn given to an empty hand");
    }

    // 4) Opening play has not happened yet: nothing on the table
    if (s.phase == Phase::FirstPlay)
    {
        assert(s.played.empty() && !s.last_play);
    }

    // 5) A live countdown always belongs to the seat that made the current lead
    if (ActiveTimer const* t = ActiveOf(s.timer))
    {
        assert(s.last_play && t->exempt_seat == s.last_play->seat);
        assert(t->sequence_id == s.timer_sequence && "Timer sequence went backwards");
        assert(t->end_timestamp_ms >= t->server_time_at_creation_ms);
    }
#endif // BIGTWO_ENABLE_TEST_HOOKS == true
    }
}
#endif //BIGTWO_INVARIANTS_HPP
