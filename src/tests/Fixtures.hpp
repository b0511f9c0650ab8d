//
// Fixtures.hpp
//

#ifndef BIGTWO_TEST_FIXTURES_HPP
#define BIGTWO_TEST_FIXTURES_HPP

#include <array>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "../core/Combo.hpp"
#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Util.hpp"

namespace bigtwo::test
{
    // "10S" -> ten of spades
    inline auto C(std::string_view text) -> core::Card
    {
        std::string_view const rank = text.substr(0, text.size() - 1);
        char const suit = text.back();

        std::optional<core::Rank> r{};
        for (std::size_t i{}; i < core::RankCount; ++i)
        {
            if (core::util::RankName(static_cast<core::Rank>(i)) == rank) r = static_cast<core::Rank>(i);
        }
        std::optional<core::Suit> s{};
        for (std::size_t i{}; i < core::SuitCount; ++i)
        {
            if (core::util::SuitName(static_cast<core::Suit>(i)).front() == suit) s = static_cast<core::Suit>(i);
        }
        BIGTWO_ASSERT(r && s, "Bad card literal in test");
        return core::Card{*s, *r};
    }

    // "3D 4D 2S" -> cards, in the given order
    inline auto Cards(std::string_view text) -> std::vector<core::Card>
    {
        std::vector<core::Card> out;
        std::istringstream in{std::string{text}};
        std::string tok;
        while (in >> tok) out.push_back(C(tok));
        return out;
    }

    inline auto MakeCombo(std::string_view text) -> core::Combo
    {
        std::optional<core::Combo> c = core::Classify(Cards(text));
        BIGTWO_ASSERT(c.has_value(), "Test combo does not classify");
        return *c;
    }

    // Seats keep the cards given and are topped up to 13 from the lowest unused cards.
    inline auto DealFrom(std::array<std::string_view, core::constants::NumSeats> const& fixed) -> core::DealT
    {
        core::DealT deal{};
        core::util::CardMask used{};
        for (std::size_t seat{}; seat < core::constants::NumSeats; ++seat)
        {
            deal[seat] = Cards(fixed[seat]);
            used |= core::util::MaskOf(deal[seat]);
        }

        uint64_t uid{};
        for (auto& hand : deal)
        {
            while (hand.size() < core::constants::HandSize)
            {
                core::Card const c = core::util::CardFromUID(uid++);
                if (used & core::util::Bit(c)) continue;
                used |= core::util::Bit(c);
                hand.push_back(c);
            }
        }
        return deal;
    }

    inline auto StateWithLead(core::SeatIdxT turn,
                              std::optional<core::LastPlay> lead,
                              core::HandCountsT counts = {13, 13, 13, 13},
                              core::Phase phase = core::Phase::Playing) -> core::TurnState
    {
        core::TurnState s{};
        s.current_turn = turn;
        s.last_play = std::move(lead);
        s.hand_counts = counts;
        s.phase = phase;
        return s;
    }
}

#endif //BIGTWO_TEST_FIXTURES_HPP
