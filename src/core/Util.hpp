//
// Util.hpp
//

#ifndef BIGTWO_UTIL_HPP
#define BIGTWO_UTIL_HPP

#include <algorithm>
#include <array>
#include <bit>
#include <span>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace bigtwo::core::util
{
    // One bit per card, bit index == Value(card).
    using CardMask = uint64_t;

    inline constexpr CardMask FullDeckMask = (CardMask{1} << constants::DeckSize) - 1;

    inline constexpr auto CardToUID(Card const& c) -> uint64_t
    {
        return Value(c);
    }

    inline constexpr auto CardFromUID(uint64_t uid) -> Card
    {
        return Card{static_cast<Suit>(uid % SuitCount), static_cast<Rank>(uid / SuitCount)};
    }

    inline constexpr auto Bit(Card const& c) -> CardMask
    {
        return CardMask{1} << CardToUID(c);
    }

    inline auto MaskOf(std::span<Card const> cards) -> CardMask
    {
        CardMask m{};
        for (Card const& c : cards) m |= Bit(c);
        return m;
    }

    inline auto CardsOf(CardMask m) -> std::vector<Card>
    {
        std::vector<Card> out;
        out.reserve(static_cast<size_t>(std::popcount(m)));
        while (m != 0)
        {
            auto const uid = static_cast<uint64_t>(std::countr_zero(m));
            out.push_back(CardFromUID(uid));
            m &= m - 1;
        }
        return out;
    }

    inline auto CountOfRank(CardMask m, Rank r) -> int
    {
        CardMask const rank_bits = CardMask{0xF} << (std::to_underlying(r) * SuitCount);
        return std::popcount(m & rank_bits);
    }

    inline auto CountOfSuit(CardMask m, Suit s) -> int
    {
        int n{};
        for (size_t r{}; r < RankCount; ++r)
        {
            n += static_cast<int>((m >> (r * SuitCount + std::to_underlying(s))) & 1U);
        }
        return n;
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            CardMask const card = Bit(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Mask() const -> CardMask
        {
            return cards_;
        }
    private:
        CardMask cards_;
        bool contains_dup_;
    };

    inline auto HoldsAll(std::span<Card const> hand, std::span<Card const> cards) -> bool
    {
        CardMask const owned = MaskOf(hand);
        return std::ranges::all_of(cards, [owned](Card const& c) { return (owned & Bit(c)) != 0; });
    }

    inline auto SortCards(std::vector<Card>& cards) -> void
    {
        std::ranges::sort(cards, [](Card const& a, Card const& b) { return Value(a) < Value(b); });
    }

    inline auto RankName(Rank r) -> std::string_view
    {
        static constexpr std::array<std::string_view, RankCount> map{
            "3","4","5","6","7","8","9","10","J","Q","K","A","2"
        };
        return map[std::to_underlying(r)];
    }

    inline auto SuitName(Suit s) -> std::string_view
    {
        switch (s)
        {
            case Suit::Diamonds: return "D";
            case Suit::Clubs:    return "C";
            case Suit::Hearts:   return "H";
            case Suit::Spades:   return "S";
        }
        return "?";
    }

    inline auto ToString(Card const& c) -> std::string
    {
        std::string s{RankName(c.rank)};
        s += SuitName(c.suit);
        return s;
    }

    inline auto ToString(std::span<Card const> cards) -> std::string
    {
        std::string body;
        for (size_t i{}; i < cards.size(); ++i)
        {
            body += (i ? "," : "");
            body += ToString(cards[i]);
        }
        return body;
    }
}

#endif //BIGTWO_UTIL_HPP
