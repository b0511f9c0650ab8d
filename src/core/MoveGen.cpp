//
// MoveGen.cpp
//

#include "MoveGen.hpp"

#include <algorithm>

#include "Exception.hpp"
#include "Util.hpp"
#include "Validator.hpp"

namespace bigtwo::core
{
    namespace
    {
        auto SameRankSets(std::vector<Card> const& sorted, std::size_t const size, std::vector<Combo>& out) -> void
        {
            std::size_t const n = sorted.size();
            for (std::size_t i{}; i < n; ++i)
            {
                for (std::size_t j{i + 1}; j < n && sorted[j].rank == sorted[i].rank; ++j)
                {
                    if (size == 2)
                    {
                        std::array<Card, 2> const pick{sorted[i], sorted[j]};
                        if (auto c = Classify(pick)) out.push_back(std::move(*c));
                        continue;
                    }
                    for (std::size_t k{j + 1}; k < n && sorted[k].rank == sorted[i].rank; ++k)
                    {
                        std::array<Card, 3> const pick{sorted[i], sorted[j], sorted[k]};
                        if (auto c = Classify(pick)) out.push_back(std::move(*c));
                    }
                }
            }
        }

        auto FiveCardCombos(std::vector<Card> const& sorted, std::vector<Combo>& out) -> void
        {
            std::size_t const n = sorted.size();
            if (n < 5) return;
            std::array<std::size_t, 5> idx{0, 1, 2, 3, 4};
            for (;;)
            {
                std::vector<Card> const pick{sorted[idx[0]], sorted[idx[1]], sorted[idx[2]],
                                             sorted[idx[3]], sorted[idx[4]]};
                if (auto c = Classify(pick)) out.push_back(std::move(*c));

                // next lexicographic 5-subset
                int i = 4;
                while (i >= 0 && idx[static_cast<std::size_t>(i)] == n - 5 + static_cast<std::size_t>(i)) --i;
                if (i < 0) break;
                ++idx[static_cast<std::size_t>(i)];
                for (auto j = static_cast<std::size_t>(i) + 1; j < 5; ++j) idx[j] = idx[j - 1] + 1;
            }
        }
    }

    auto EnumerateCombos(std::span<Card const> hand) -> std::vector<Combo>
    {
        std::vector<Card> sorted(hand.begin(), hand.end());
        util::SortCards(sorted);

        std::vector<Combo> out;
        for (Card const& c : sorted)
        {
            out.push_back(Combo{ComboType::Single, {c}, Value(c)});
        }
        SameRankSets(sorted, 2, out);
        SameRankSets(sorted, 3, out);
        FiveCardCombos(sorted, out);
        return out;
    }

    auto LegalPlays(SeatView const& view) -> std::vector<Combo>
    {
        std::vector<Combo> out;
        Combo const* last = LastCombo(view.state);
        for (Combo& c : EnumerateCombos(view.my_hand))
        {
            if (last != nullptr && c.cards.size() != last->cards.size()) continue;
            if (ValidatePlay(view.seat, c.cards, view.state, view.my_hand).has_value())
                out.push_back(std::move(c));
        }
        return out;
    }

    auto Weaker(Combo const& a, Combo const& b) -> bool
    {
        if (a.cards.size() != b.cards.size()) return a.cards.size() < b.cards.size();
        if (a.type != b.type) return std::to_underlying(a.type) < std::to_underlying(b.type);
        return a.key < b.key;
    }

    auto RecommendPlay(SeatView const& view) -> std::optional<Combo>
    {
        std::vector<Combo> legal = LegalPlays(view);
        if (legal.empty()) return std::nullopt;
        return *std::ranges::min_element(legal, Weaker);
    }

    auto DefaultAction(SeatView const& view) -> PlayerAction
    {
        if (ValidatePass(view.seat, view.state, view.my_hand).has_value())
            return PassAction{};

        std::optional<Combo> const rec = RecommendPlay(view);
        if (!rec) [[unlikely]]
        {
            BIGTWO_THROW(error::Code::Rules, "Seat can neither pass nor play");
        }
        return PlayAction{rec->cards};
    }
}
