//
// Combo.cpp
//

#include "Combo.hpp"

#include <algorithm>
#include <ranges>

#include "Util.hpp"

namespace bigtwo::core
{
    namespace
    {
        auto RankBits(std::span<Card const> cards) -> uint16_t
        {
            uint16_t bits{};
            for (Card const& c : cards) bits |= static_cast<uint16_t>(1U << std::to_underlying(c.rank));
            return bits;
        }

        auto SequenceBits(std::array<Rank, 5> const& seq) -> uint16_t
        {
            uint16_t bits{};
            for (Rank r : seq) bits |= static_cast<uint16_t>(1U << std::to_underlying(r));
            return bits;
        }

        auto AllSameRank(std::span<Card const> cards) -> bool
        {
            return std::ranges::all_of(cards, [&](Card const& c) { return c.rank == cards.front().rank; });
        }

        auto AllSameSuit(std::span<Card const> cards) -> bool
        {
            return std::ranges::all_of(cards, [&](Card const& c) { return c.suit == cards.front().suit; });
        }

        // Highest card sits last once sorted.
        auto HighKey(std::vector<Card> const& sorted) -> uint16_t
        {
            return Value(sorted.back());
        }

        auto ClassifyFive(std::vector<Card> const& sorted) -> std::optional<Combo>
        {
            std::array<uint8_t, RankCount> counts{};
            for (Card const& c : sorted) ++counts[std::to_underlying(c.rank)];

            uint8_t max_count{};
            std::size_t max_rank{};
            bool has_pair = false;
            for (std::size_t r{}; r < RankCount; ++r)
            {
                if (counts[r] > max_count)
                {
                    max_count = counts[r];
                    max_rank = r;
                }
                has_pair |= (counts[r] == 2);
            }

            bool const flush = AllSameSuit(sorted);
            std::optional<std::size_t> const seq = StraightIndex(sorted);

            if (seq && flush)
            {
                return Combo{ComboType::StraightFlush, sorted, StraightKey(*seq, sorted.front().suit)};
            }
            if (max_count == 4)
            {
                return Combo{ComboType::FourOfAKind, sorted, RankKey(static_cast<Rank>(max_rank))};
            }
            if (max_count == 3 && has_pair)
            {
                return Combo{ComboType::FullHouse, sorted, RankKey(static_cast<Rank>(max_rank))};
            }
            if (flush)
            {
                return Combo{ComboType::Flush, sorted, HighKey(sorted)};
            }
            if (seq)
            {
                Rank const top = StraightSequences[*seq].back();
                auto const it = std::ranges::find_if(sorted, [top](Card const& c) { return c.rank == top; });
                return Combo{ComboType::Straight, sorted, StraightKey(*seq, it->suit)};
            }
            return std::nullopt;
        }
    }

    auto IsFiveCard(ComboType t) noexcept -> bool
    {
        return std::to_underlying(t) >= std::to_underlying(ComboType::Straight);
    }

    auto StraightIndex(std::span<Card const> cards) -> std::optional<std::size_t>
    {
        if (cards.size() != 5) return std::nullopt;
        uint16_t const bits = RankBits(cards);
        for (std::size_t i{}; i < StraightSequences.size(); ++i)
        {
            if (bits == SequenceBits(StraightSequences[i])) return i;
        }
        return std::nullopt;
    }

    auto Classify(std::span<Card const> cards) -> std::optional<Combo>
    {
        util::CardUniqueChecker checker{};
        for (Card const& c : cards) checker.Add(c);
        if (checker.ContainsDup()) return std::nullopt;

        std::vector<Card> sorted(cards.begin(), cards.end());
        util::SortCards(sorted);

        switch (sorted.size())
        {
        case 1:
            return Combo{ComboType::Single, sorted, HighKey(sorted)};
        case 2:
            if (!AllSameRank(sorted)) return std::nullopt;
            return Combo{ComboType::Pair, sorted, HighKey(sorted)};
        case 3:
            if (!AllSameRank(sorted)) return std::nullopt;
            return Combo{ComboType::Triple, sorted, HighKey(sorted)};
        case 5:
            return ClassifyFive(sorted);
        default:
            return std::nullopt;
        }
    }

    auto CanBeat(Combo const& play, Combo const* last) -> bool
    {
        if (last == nullptr) return true;
        if (play.cards.size() != last->cards.size()) return false;

        if (IsFiveCard(play.type))
        {
            if (play.type != last->type)
                return std::to_underlying(play.type) > std::to_underlying(last->type);
            return play.key > last->key;
        }
        return play.type == last->type && play.key > last->key;
    }

    auto to_string(ComboType t) -> std::string_view
    {
        switch (t)
        {
        case ComboType::Single: return "Single";
        case ComboType::Pair: return "Pair";
        case ComboType::Triple: return "Triple";
        case ComboType::Straight: return "Straight";
        case ComboType::Flush: return "Flush";
        case ComboType::FullHouse: return "FullHouse";
        case ComboType::FourOfAKind: return "FourOfAKind";
        case ComboType::StraightFlush: return "StraightFlush";
        }
        return "?";
    }
}
