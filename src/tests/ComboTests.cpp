#include <gtest/gtest.h>

#include "../core/Combo.hpp"
#include "../core/MoveGen.hpp"
#include "Fixtures.hpp"

using namespace bigtwo::core;
using namespace bigtwo::test;

namespace
{
    auto TypeOf(std::string_view text) -> std::optional<ComboType>
    {
        std::optional<Combo> const c = Classify(Cards(text));
        if (!c) return std::nullopt;
        return c->type;
    }

    auto Beats(std::string_view play, std::string_view last) -> bool
    {
        Combo const l = MakeCombo(last);
        return CanBeat(MakeCombo(play), &l);
    }
}

TEST(Combo, ClassifiesEveryShape)
{
    EXPECT_EQ(TypeOf("7H"), ComboType::Single);
    EXPECT_EQ(TypeOf("9C 9S"), ComboType::Pair);
    EXPECT_EQ(TypeOf("QD QC QS"), ComboType::Triple);
    EXPECT_EQ(TypeOf("5D 6C 7H 8S 9D"), ComboType::Straight);
    EXPECT_EQ(TypeOf("3H 8H JH KH 2H"), ComboType::Flush);
    EXPECT_EQ(TypeOf("4D 4C 4S 10H 10S"), ComboType::FullHouse);
    EXPECT_EQ(TypeOf("JD JC JH JS 3D"), ComboType::FourOfAKind);
    EXPECT_EQ(TypeOf("6S 7S 8S 9S 10S"), ComboType::StraightFlush);
}

TEST(Combo, RejectsMalformedSets)
{
    EXPECT_FALSE(TypeOf(""));
    EXPECT_FALSE(TypeOf("9C 10C"));
    EXPECT_FALSE(TypeOf("QD QC KS"));
    EXPECT_FALSE(TypeOf("4D 4C 4S 4H"));
    EXPECT_FALSE(TypeOf("3D 3C 4D 4C 5S 6S"));
    EXPECT_FALSE(TypeOf("5D 6C 7H 8S 10D"));
    // duplicates never classify
    EXPECT_FALSE(TypeOf("7H 7H"));
}

TEST(Combo, StraightSequencesWrapOnlyThroughTheTable)
{
    EXPECT_EQ(TypeOf("AD 2C 3H 4S 5D"), ComboType::Straight);
    EXPECT_EQ(TypeOf("2C 3H 4S 5D 6D"), ComboType::Straight);
    EXPECT_EQ(TypeOf("10D JC QH KS AD"), ComboType::Straight);
    EXPECT_FALSE(TypeOf("JC QH KS AD 2D"));
    EXPECT_FALSE(TypeOf("QH KS AD 2D 3C"));

    EXPECT_EQ(StraightIndex(Cards("AD 2C 3H 4S 5D")), std::optional<std::size_t>{0});
    EXPECT_EQ(StraightIndex(Cards("10D JC QH KS AD")), std::optional<std::size_t>{9});
}

TEST(Combo, SinglesAndSetsCompareByHighestCard)
{
    EXPECT_TRUE(Beats("2D", "AS"));
    EXPECT_TRUE(Beats("3S", "3H"));
    EXPECT_FALSE(Beats("3H", "3S"));
    EXPECT_TRUE(Beats("2C 2D", "AH AS"));
    EXPECT_TRUE(Beats("9D 9S", "9C 9H"));
    EXPECT_FALSE(Beats("9C 9H", "9D 9S"));
    EXPECT_TRUE(Beats("5D 5C 5H", "4C 4H 4S"));
}

TEST(Combo, CardCountMustMatchTheLead)
{
    EXPECT_FALSE(Beats("2S", "3D 3C"));
    EXPECT_FALSE(Beats("2S 2H", "3D"));
    EXPECT_FALSE(Beats("6S 7S 8S 9S 10S", "2S"));
    EXPECT_FALSE(Beats("JD JC JH JS 3D", "AD AC"));
}

TEST(Combo, FiveCardTiersOutrankEachOther)
{
    std::vector<std::string_view> const ladder{
        "10D JC QH KS AD",     // best straight
        "3H 4H 6H 8H 9H",      // weakest-looking flush
        "3D 3C 3H 4D 4C",      // weakest full house
        "3D 3C 3H 3S 4D",      // weakest four of a kind
        "AD 2D 3D 4D 5D",      // weakest straight flush
    };
    for (std::size_t hi = 1; hi < ladder.size(); ++hi)
    {
        for (std::size_t lo = 0; lo < hi; ++lo)
        {
            EXPECT_TRUE(Beats(ladder[hi], ladder[lo])) << ladder[hi] << " vs " << ladder[lo];
            EXPECT_FALSE(Beats(ladder[lo], ladder[hi])) << ladder[lo] << " vs " << ladder[hi];
        }
    }
}

TEST(Combo, SameTierUsesItsOwnKey)
{
    // straights: sequence first, then suit of the top card
    EXPECT_TRUE(Beats("2C 3H 4S 5D 6D", "AD 2C 3H 4S 5S"));
    EXPECT_TRUE(Beats("5D 6C 7H 8S 9S", "5D 6C 7H 8S 9H"));
    // flushes: highest card
    EXPECT_FALSE(Beats("3S 4S 5S 7S 9S", "8H 10H QH KH 2H"));
    EXPECT_TRUE(Beats("3H 4H 5H 7H 2H", "8S 10S QS KS AS"));
    // full house and quads: the set rank only
    EXPECT_TRUE(Beats("5D 5C 5H 3D 3C", "4D 4C 4S 2D 2S"));
    EXPECT_TRUE(Beats("9D 9C 9H 9S 3D", "8D 8C 8H 8S 2S"));
    // straight flush: sequence then suit
    EXPECT_TRUE(Beats("6D 7D 8D 9D 10D", "5S 6S 7S 8S 9S"));
    EXPECT_TRUE(Beats("5S 6S 7S 8S 9S", "5H 6H 7H 8H 9H"));
}

TEST(Combo, LeadingAcceptsAnyValidCombo)
{
    EXPECT_TRUE(CanBeat(MakeCombo("3D"), nullptr));
    EXPECT_TRUE(CanBeat(MakeCombo("3D 3C 3H 4D 4C"), nullptr));
}

TEST(MoveGen, EnumeratesEveryFormableCombo)
{
    std::vector<Combo> const all = EnumerateCombos(Cards("3D 3C 3H 4S 5D 6C 7H"));

    auto count = [&all](ComboType t)
    {
        return std::ranges::count_if(all, [t](Combo const& c) { return c.type == t; });
    };
    EXPECT_EQ(count(ComboType::Single), 7);
    EXPECT_EQ(count(ComboType::Pair), 3);
    EXPECT_EQ(count(ComboType::Triple), 1);
    // 3x(3D|3C|3H) 4S 5D 6C 7H
    EXPECT_EQ(count(ComboType::Straight), 3);
    EXPECT_EQ(count(ComboType::FullHouse), 0);
}
