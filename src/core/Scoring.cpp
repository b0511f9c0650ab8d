//
// Scoring.cpp
//

#include "Scoring.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace bigtwo::core
{
    auto PointsMultiplier(std::size_t const cards_left) noexcept -> uint32_t
    {
        if (cards_left == 0) return 0;
        if (cards_left <= 4) return 1;
        if (cards_left <= 9) return 2;
        return 3;
    }

    auto ComputeMatchScore(EndingHandSizesT const& ending_hand_sizes) -> MatchScore
    {
        MatchScore out{};
        for (std::size_t seat{}; seat < constants::NumSeats; ++seat)
        {
            std::size_t const left = ending_hand_sizes[seat];
            out[seat] = static_cast<uint32_t>(left) * PointsMultiplier(left);
        }
        return out;
    }

    auto IsGameOver(ScoreArrayT const& totals, uint32_t const threshold) noexcept -> bool
    {
        return std::ranges::any_of(totals, [threshold](uint32_t t) { return t >= threshold; });
    }

    auto FindFinalWinner(ScoreArrayT const& totals) noexcept -> SeatIdxT
    {
        // min_element keeps the first of equal minima
        auto const it = std::ranges::min_element(totals);
        return static_cast<SeatIdxT>(std::distance(totals.begin(), it));
    }

    auto FinishPositions(ScoreArrayT const& totals) -> std::array<uint8_t, constants::NumSeats>
    {
        std::array<SeatIdxT, constants::NumSeats> order{};
        std::iota(order.begin(), order.end(), SeatIdxT{0});
        std::ranges::stable_sort(order, [&totals](SeatIdxT a, SeatIdxT b) { return totals[a] < totals[b]; });

        std::array<uint8_t, constants::NumSeats> place{};
        for (std::size_t i{}; i < order.size(); ++i)
        {
            place[order[i]] = static_cast<uint8_t>(i + 1);
        }
        return place;
    }

    auto GameTotals::Record(MatchRecord rec) -> void
    {
        for (std::size_t seat{}; seat < constants::NumSeats; ++seat)
        {
            totals_[seat] += rec.score[seat];
        }
        history_.push_back(std::move(rec));
    }
}
