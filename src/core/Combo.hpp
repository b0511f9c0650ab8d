//
// Combo.hpp
//

#ifndef BIGTWO_COMBO_HPP
#define BIGTWO_COMBO_HPP

#include <array>
#include <optional>
#include <span>
#include <string_view>

#include "Types.hpp"

namespace bigtwo::core
{
    // Declaration order is the 5-card precedence (Straight < ... < StraightFlush).
    enum class ComboType : uint8_t
    {
        Single = 0,
        Pair,
        Triple,
        Straight,
        Flush,
        FullHouse,
        FourOfAKind,
        StraightFlush
    };

    inline constexpr std::size_t ComboTypeCount = 8;
    inline constexpr std::size_t StraightSequenceCount = 10;

    // Lowest to highest. Index 0 is A-2-3-4-5, index 9 is 10-J-Q-K-A.
    inline constexpr std::array<std::array<Rank, 5>, StraightSequenceCount> StraightSequences{{
        {Rank::Ace, Rank::Two, Rank::Three, Rank::Four, Rank::Five},
        {Rank::Two, Rank::Three, Rank::Four, Rank::Five, Rank::Six},
        {Rank::Three, Rank::Four, Rank::Five, Rank::Six, Rank::Seven},
        {Rank::Four, Rank::Five, Rank::Six, Rank::Seven, Rank::Eight},
        {Rank::Five, Rank::Six, Rank::Seven, Rank::Eight, Rank::Nine},
        {Rank::Six, Rank::Seven, Rank::Eight, Rank::Nine, Rank::Ten},
        {Rank::Seven, Rank::Eight, Rank::Nine, Rank::Ten, Rank::Jack},
        {Rank::Eight, Rank::Nine, Rank::Ten, Rank::Jack, Rank::Queen},
        {Rank::Nine, Rank::Ten, Rank::Jack, Rank::Queen, Rank::King},
        {Rank::Ten, Rank::Jack, Rank::Queen, Rank::King, Rank::Ace},
    }};

    struct Combo
    {
        ComboType type{};
        std::vector<Card> cards; // ascending by value
        // Comparable only against combos of the same type.
        uint16_t key{};
    };

    auto Classify(std::span<Card const> cards) -> std::optional<Combo>;

    // nullptr last means the actor is leading.
    auto CanBeat(Combo const& play, Combo const* last) -> bool;

    auto IsFiveCard(ComboType t) noexcept -> bool;
    auto StraightIndex(std::span<Card const> cards) -> std::optional<std::size_t>;
    auto to_string(ComboType t) -> std::string_view;

    // Keys as Classify computes them, exposed for the unbeatable scan.
    constexpr auto StraightKey(std::size_t seq_idx, Suit top_suit) -> uint16_t
    {
        return static_cast<uint16_t>(seq_idx * SuitCount + std::to_underlying(top_suit));
    }
    constexpr auto RankKey(Rank r) -> uint16_t
    {
        return std::to_underlying(r);
    }
}

#endif //BIGTWO_COMBO_HPP
