//
// Types.hpp
//

#ifndef BIGTWO_TYPES_HPP
#define BIGTWO_TYPES_HPP

#define BIGTWO_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <compare>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <variant>
#include <utility>

namespace bigtwo::core::constants
{
    inline constexpr std::size_t NumSeats = 4;
    inline constexpr std::size_t HandSize = 13;
    inline constexpr std::size_t DeckSize = 52;
    inline constexpr std::size_t PassesToClearTrick = NumSeats - 1;
    inline constexpr std::uint32_t GameOverThreshold = 101;
    inline constexpr std::chrono::milliseconds AutoPassDuration{10000};
}

namespace bigtwo::core
{
    // Declaration order is comparison order.
    enum class Suit : uint8_t
    {
        Diamonds = 0,
        Clubs,
        Hearts,
        Spades
    };

    enum class Rank : uint8_t
    {
        Three = 0,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace,
        Two
    };

    inline constexpr std::size_t SuitCount = 4;
    inline constexpr std::size_t RankCount = 13;

    struct Card
    {
        constexpr Card(Suit suit, Rank rank) : suit(suit), rank(rank) {}

        Suit suit;
        Rank rank;
    };

    // 0 (3D) .. 51 (2S)
    constexpr auto Value(Card const& c) -> uint8_t
    {
        return static_cast<uint8_t>(std::to_underlying(c.rank) * SuitCount + std::to_underlying(c.suit));
    }

    constexpr auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }
    constexpr auto operator<=>(Card const& a, Card const& b) -> std::strong_ordering { return Value(a) <=> Value(b); }

    inline constexpr Card ThreeOfDiamonds{Suit::Diamonds, Rank::Three};

    using SeatIdxT = uint8_t;
    using HandT = std::vector<Card>;

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        std::chrono::milliseconds auto_pass_duration{constants::AutoPassDuration};
        uint32_t game_over_threshold{constants::GameOverThreshold};
        // deadline handed to bots driven through the Judge
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30ULL)};
        // attempts per cascade step when the room lock is contended
        uint32_t cascade_lock_retries{64};
    };
}

#endif //BIGTWO_TYPES_HPP
