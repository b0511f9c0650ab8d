//
// Unbeatable.cpp
//

#include "Unbeatable.hpp"

#include <algorithm>
#include <bit>

namespace bigtwo::core
{
    namespace
    {
        auto Has(util::CardMask const pool, Card const& c) -> bool
        {
            return (pool & util::Bit(c)) != 0;
        }

        auto HighestOfRank(util::CardMask const pool, Rank const r) -> std::optional<uint16_t>
        {
            for (int s = static_cast<int>(SuitCount) - 1; s >= 0; --s)
            {
                Card const c{static_cast<Suit>(s), r};
                if (Has(pool, c)) return Value(c);
            }
            return std::nullopt;
        }

        // Descending rank scan; the first rank with enough copies wins.
        auto BestSet(util::CardMask const pool, int const copies) -> std::optional<uint16_t>
        {
            for (int r = static_cast<int>(RankCount) - 1; r >= 0; --r)
            {
                auto const rank = static_cast<Rank>(r);
                if (util::CountOfRank(pool, rank) >= copies) return HighestOfRank(pool, rank);
            }
            return std::nullopt;
        }

        auto BestStraight(util::CardMask const pool) -> std::optional<uint16_t>
        {
            for (int i = static_cast<int>(StraightSequenceCount) - 1; i >= 0; --i)
            {
                auto const& seq = StraightSequences[static_cast<std::size_t>(i)];
                bool const formable = std::ranges::all_of(seq, [pool](Rank r) { return util::CountOfRank(pool, r) > 0; });
                if (!formable) continue;
                auto const top = HighestOfRank(pool, seq.back());
                return StraightKey(static_cast<std::size_t>(i), util::CardFromUID(*top).suit);
            }
            return std::nullopt;
        }

        auto BestStraightFlush(util::CardMask const pool) -> std::optional<uint16_t>
        {
            for (int i = static_cast<int>(StraightSequenceCount) - 1; i >= 0; --i)
            {
                auto const& seq = StraightSequences[static_cast<std::size_t>(i)];
                for (int s = static_cast<int>(SuitCount) - 1; s >= 0; --s)
                {
                    auto const suit = static_cast<Suit>(s);
                    bool const formable = std::ranges::all_of(seq, [pool, suit](Rank r) { return Has(pool, Card{suit, r}); });
                    if (formable) return StraightKey(static_cast<std::size_t>(i), suit);
                }
            }
            return std::nullopt;
        }

        auto BestFlush(util::CardMask const pool) -> std::optional<uint16_t>
        {
            std::optional<uint16_t> best{};
            for (std::size_t s{}; s < SuitCount; ++s)
            {
                auto const suit = static_cast<Suit>(s);
                if (util::CountOfSuit(pool, suit) < 5) continue;
                for (int r = static_cast<int>(RankCount) - 1; r >= 0; --r)
                {
                    Card const c{suit, static_cast<Rank>(r)};
                    if (!Has(pool, c)) continue;
                    if (!best || Value(c) > *best) best = Value(c);
                    break;
                }
            }
            return best;
        }

        auto BestFullHouse(util::CardMask const pool) -> std::optional<uint16_t>
        {
            for (int t = static_cast<int>(RankCount) - 1; t >= 0; --t)
            {
                auto const trip = static_cast<Rank>(t);
                if (util::CountOfRank(pool, trip) < 3) continue;
                for (std::size_t p{}; p < RankCount; ++p)
                {
                    auto const pair = static_cast<Rank>(p);
                    if (pair != trip && util::CountOfRank(pool, pair) >= 2) return RankKey(trip);
                }
            }
            return std::nullopt;
        }

        auto BestFourOfAKind(util::CardMask const pool) -> std::optional<uint16_t>
        {
            if (std::popcount(pool) < 5) return std::nullopt;
            for (int r = static_cast<int>(RankCount) - 1; r >= 0; --r)
            {
                auto const rank = static_cast<Rank>(r);
                if (util::CountOfRank(pool, rank) == 4) return RankKey(rank);
            }
            return std::nullopt;
        }
    }

    auto BestKeyIn(util::CardMask const pool, ComboType const type) -> std::optional<uint16_t>
    {
        switch (type)
        {
        case ComboType::Single:
            if (pool == 0) return std::nullopt;
            return static_cast<uint16_t>(63 - std::countl_zero(pool));
        case ComboType::Pair: return BestSet(pool, 2);
        case ComboType::Triple: return BestSet(pool, 3);
        case ComboType::Straight: return BestStraight(pool);
        case ComboType::Flush: return BestFlush(pool);
        case ComboType::FullHouse: return BestFullHouse(pool);
        case ComboType::FourOfAKind: return BestFourOfAKind(pool);
        case ComboType::StraightFlush: return BestStraightFlush(pool);
        }
        return std::nullopt;
    }

    auto AnyBeaterIn(util::CardMask const pool, Combo const& play) -> bool
    {
        if (IsFiveCard(play.type))
        {
            for (auto t = std::to_underlying(ComboType::StraightFlush); t > std::to_underlying(play.type); --t)
            {
                if (BestKeyIn(pool, static_cast<ComboType>(t))) return true;
            }
        }
        std::optional<uint16_t> const best = BestKeyIn(pool, play.type);
        return best && *best > play.key;
    }

    auto HighestRemainingPredicate::IsUnbeatable(Combo const& play, UnbeatableContext const& ctx) const -> bool
    {
        util::CardMask const unplayed = util::FullDeckMask & ~ctx.played_before & ~util::MaskOf(play.cards);
        return !AnyBeaterIn(unplayed, play);
    }

    auto FullInformationPredicate::IsUnbeatable(Combo const& play, UnbeatableContext const& ctx) const -> bool
    {
        for (std::size_t seat{}; seat < constants::NumSeats; ++seat)
        {
            if (seat == ctx.actor) continue;
            if (AnyBeaterIn(ctx.hands[seat], play)) return false;
        }
        return true;
    }

    auto MakeDefaultPredicate() -> std::unique_ptr<UnbeatablePredicate>
    {
        return std::make_unique<HighestRemainingPredicate>();
    }
}
